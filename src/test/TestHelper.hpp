#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <random>
#include <iterator>

#include "FastqReader.hpp"

//path of a file in src/test/test_data
inline std::string test_data(const std::string& file)
{
    return (std::filesystem::path(TEST_DATA_DIR) / file).string();
}

/// a fresh directory below the system temp directory, removed again at the end of the test
class TmpDir
{
    public:
        explicit TmpDir(const std::string& name)
        {
            std::random_device rd;
            path = std::filesystem::temp_directory_path() / ("platecall_" + name + "_" + std::to_string(rd()));
            std::filesystem::remove_all(path);
            std::filesystem::create_directories(path);
        }
        ~TmpDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
        TmpDir(const TmpDir&) = delete;
        TmpDir& operator=(const TmpDir&) = delete;

        std::string str() const { return path.string(); }
        std::string file(const std::string& name) const { return (path / name).string(); }

        std::filesystem::path path;
};

inline void write_text(const std::string& path, const std::string& text)
{
    std::filesystem::path p(path);
    if(p.has_parent_path()){std::filesystem::create_directories(p.parent_path());}
    std::ofstream out(path);
    out << text;
}

inline std::string read_text(const std::string& path)
{
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

//fastq record whose header ends in the barcode name
inline fastqLine make_read(const std::string& readName, const std::string& barcode, const std::string& seq = "ACGT")
{
    fastqLine line;
    line.name = readName + " 1:N:0:1 " + barcode;
    line.line = seq;
    line.quality = std::string(seq.size(), 'I');
    return line;
}
