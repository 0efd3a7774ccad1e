/// @file score_history.hpp
/// @brief Umbrella header for the score-history library.
///
/// Include this single header for access to all public types:
/// ScoreEngine, PropertyEngine, ObjectStore, HeadStore, VersionIndex,
/// BlobStore, the object model, commits, JSON codecs, configuration, logging and errors.

#pragma once

#include <score-history/annotation_engine.hpp>
#include <score-history/blob_store.hpp>
#include <score-history/commit.hpp>
#include <score-history/config.hpp>
#include <score-history/error.hpp>
#include <score-history/hash.hpp>
#include <score-history/head_store.hpp>
#include <score-history/json.hpp>
#include <score-history/log.hpp>
#include <score-history/object_store.hpp>
#include <score-history/objects.hpp>
#include <score-history/property_engine.hpp>
#include <score-history/score_engine.hpp>
#include <score-history/types.hpp>
#include <score-history/version_index.hpp>
