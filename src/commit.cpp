#include <score-history/commit.hpp>

#include <score-history/error.hpp>

#include <iterator>
#include <string>
#include <variant>

namespace score_history {

void apply_operation(PageSequence& pages, const Commit& commit) {
    std::visit(overload{
        [&](const AddPage& op) {
            pages.push_back(PageEntry{
                .page = Page{.image = op.image, .thumbnail = op.thumbnail, .number = op.number},
                .hash = std::nullopt,
            });
        },
        [&](const InsertPage& op) {
            if (op.index > pages.size()) {
                throw ScoreError{ErrorKind::invalid_operation,
                                 "insert_page index " + std::to_string(op.index) +
                                 " is out of range for " + std::to_string(pages.size()) + " page(s)"};
            }
            pages.insert(pages.begin() + static_cast<std::ptrdiff_t>(op.index), PageEntry{
                .page = Page{.image = op.image, .thumbnail = op.thumbnail, .number = op.number},
                .hash = std::nullopt,
            });
        },
        [&](const DeletePage& op) {
            if (op.index >= pages.size()) {
                throw ScoreError{ErrorKind::invalid_operation,
                                 "delete_page index " + std::to_string(op.index) +
                                 " is out of range for " + std::to_string(pages.size()) + " page(s)"};
            }
            pages.erase(pages.begin() + static_cast<std::ptrdiff_t>(op.index));
        },
        [&](const UpdateProperty&) {
            throw ScoreError{ErrorKind::invalid_operation,
                             "update_property is not a page operation; "
                             "submit it as a property update with the property parent hash"};
        },
    }, commit);
}

auto apply_operations(const PageSequence& pages, const std::vector<Commit>& commits)
    -> PageSequence {
    auto result = pages;
    for (std::size_t i = 0; i < commits.size(); ++i) {
        try {
            apply_operation(result, commits[i]);
        } catch (const ScoreError& e) {
            throw ScoreError{e.kind(),
                             "operation " + std::to_string(i) + ": " + e.error().message};
        }
    }
    return result;
}

}  // namespace score_history
