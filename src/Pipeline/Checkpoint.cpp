#include "PipelineState.hpp"

#include <fstream>
#include <filesystem>
#include <boost/archive/text_oarchive.hpp>
#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/archive_exception.hpp>

namespace
{

const std::string CHECKPOINT_MAGIC = "PLATECALL_CHECKPOINT";
const int CHECKPOINT_FORMAT = 1;

CheckpointError unreadable(const std::string& path, const std::string& reason)
{
    return CheckpointError("Checkpoint " + path + " can not be restored (" + reason + "). "
                           "Please resume from an earlier checkpoint in the same directory.");
}

}

void save_checkpoint(const std::string& path, const std::string& tag, size_t position, const PipelineState& state)
{
    std::filesystem::path checkpointPath(path);
    if(checkpointPath.has_parent_path()){std::filesystem::create_directories(checkpointPath.parent_path());}
    const std::string tmpPath = path + ".tmp";

    {
        std::ofstream out(tmpPath);
        if(!out)
        {
            throw StageError("Could not open checkpoint for writing: " + tmpPath);
        }
        out << CHECKPOINT_MAGIC << ' ' << CHECKPOINT_FORMAT << '\n';
        out << tag << '\n' << position << '\n';
        {
            boost::archive::text_oarchive oa(out);
            oa << state;
        }
        if(!out)
        {
            throw StageError("Writing checkpoint failed: " + tmpPath);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if(ec)
    {
        throw StageError("Could not move checkpoint to " + path + ": " + ec.message());
    }
}

PipelineState load_checkpoint(const std::string& path, CheckpointHeader* header)
{
    std::ifstream in(path);
    if(!in)
    {
        throw unreadable(path, "file can not be opened");
    }

    std::string magic;
    int format = 0;
    if(!(in >> magic >> format) || magic != CHECKPOINT_MAGIC)
    {
        throw unreadable(path, "not a checkpoint file");
    }
    if(format > CHECKPOINT_FORMAT)
    {
        throw unreadable(path, "written by a newer version (format " + std::to_string(format) + ")");
    }

    CheckpointHeader fileHeader;
    in.ignore(1);
    if(!std::getline(in, fileHeader.tag) || !(in >> fileHeader.position))
    {
        throw unreadable(path, "truncated header");
    }

    PipelineState state;
    try
    {
        boost::archive::text_iarchive ia(in);
        ia >> state;
    }
    catch(const boost::archive::archive_exception& e)
    {
        throw unreadable(path, e.what());
    }
    catch(const std::exception& e)
    {
        throw unreadable(path, e.what());
    }

    if(header != nullptr)
    {
        *header = fileHeader;
    }
    return state;
}
