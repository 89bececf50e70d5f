#include "utils.h"

#include <algorithm>
#include <dlib/dir_nav.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

std::string base_name(const std::string& file_name)
{
    const auto pos = file_name.find_last_of("/\\");
    if (pos == std::string::npos)
        return file_name;
    return file_name.substr(pos + 1);
}

std::string base_name_without_extension(const std::string& file_name)
{
    return fs::path(base_name(file_name)).stem().string();
}

std::string read_text_file(const fs::path& path)
{
    std::ifstream fin(path, std::ios::binary);
    if (not fin.good())
        throw io_error("Failed to read file: " + path.string());
    std::ostringstream sout;
    sout << fin.rdbuf();
    if (fin.bad())
        throw io_error("Failed to read file: " + path.string());
    return sout.str();
}

void write_text_file(const fs::path& path, const std::string& content)
{
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (not fout.good())
        throw io_error("Failed to write output file: " + path.string());
    fout << content;
    fout.flush();
    if (not fout.good())
        throw io_error("Failed to write output file: " + path.string());
}

void copy_image_file(const fs::path& from, const fs::path& to)
{
    std::error_code ec;
    if (fs::exists(to, ec) and fs::equivalent(from, to, ec))
        return;
    ec.clear();
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        throw io_error(
            "Failed to copy image " + from.string() + " to " + to.string() + ": " +
            ec.message());
    }
}

void make_directories(const fs::path& path)
{
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec or not fs::is_directory(path))
    {
        throw io_error(
            "Failed to create directory: " + path.string() +
            (ec ? ": " + ec.message() : std::string()));
    }
}

std::vector<fs::path> find_annotation_files(const fs::path& path)
{
    if (not fs::exists(path))
        throw config_error("Input path does not exist: " + path.string());

    std::vector<fs::path> files;
    if (not fs::is_directory(path))
    {
        files.push_back(path);
        return files;
    }

    const auto data_dir = dlib::directory(path.string());
    const auto found = dlib::get_files_in_directory_tree(data_dir, dlib::match_ending(".json"));
    for (const auto& file : found)
        files.emplace_back(file.full_name());
    std::sort(files.begin(), files.end());
    return files;
}
