#pragma once

#include <fstream>
#include <sstream>
#include <string>
#include <boost/filesystem.hpp>
#include "number.h"

using DecimalType = num::DefaultNumber;

inline DecimalType createDecimal(const std::string& valueString)
{
    return dec::fromString<DecimalType>(valueString);
}

/**
 * @brief Scratch directory that is removed when the test finishes
 */
class TemporaryDirectory
{
public:
    TemporaryDirectory()
        : mPath(boost::filesystem::temp_directory_path() /
                boost::filesystem::unique_path("riskstops-test-%%%%-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(mPath);
    }

    ~TemporaryDirectory()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all(mPath, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    std::string file(const std::string& name) const
    {
        return (mPath / name).string();
    }

    std::string writeFile(const std::string& name, const std::string& contents) const
    {
        const std::string fileName = file(name);
        std::ofstream out(fileName);
        out << contents;
        return fileName;
    }

private:
    boost::filesystem::path mPath;
};

inline std::string readWholeFile(const std::string& fileName)
{
    std::ifstream in(fileName);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}
