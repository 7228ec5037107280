#pragma once

#include <string>
#include <boost/serialization/access.hpp>
#include <boost/serialization/version.hpp>

#include "PipelineConfig.hpp"
#include "PathLayout.hpp"

/** @brief everything a run needs to continue: config, path layout and the index of the first stage not yet completed
 * @details the only object written to a checkpoint. Loggers, open files and thread pools are never part of it.
**/
struct PipelineState
{
    PipelineConfig config;
    PathLayout layout;
    size_t cursor = 0;

    private:
        friend class boost::serialization::access;
        template<class Archive>
        void serialize(Archive& ar, const unsigned int /*version*/)
        {
            ar & config & layout & cursor;
        }
};
BOOST_CLASS_VERSION(PipelineState, 1)

//checkpoint file tag: stage name and position in the stage list, written in front of the state
struct CheckpointHeader
{
    std::string tag;
    size_t position = 0;
};

//writes state to path (via a temporary file that is renamed), failures throw a StageError
void save_checkpoint(const std::string& path, const std::string& tag, size_t position, const PipelineState& state);

/**
 * @brief reads a checkpoint back
 * @details a missing, truncated or corrupt file or one written by a newer version throws a CheckpointError
 * telling the user to fall back to an earlier checkpoint.
**/
PipelineState load_checkpoint(const std::string& path, CheckpointHeader* header = nullptr);
