#ifndef utils_h_INCLUDED
#define utils_h_INCLUDED

#include "errors.h"

#include <filesystem>
#include <string>
#include <vector>

// Last path component of a declared file name, accepting both '/' and '\' as separators.
std::string base_name(const std::string& file_name);

// base_name() without its extension: "images/img1.jpg" => "img1"
std::string base_name_without_extension(const std::string& file_name);

std::string read_text_file(const std::filesystem::path& path);

void write_text_file(const std::filesystem::path& path, const std::string& content);

// Overwrites an existing target.  Copying a file onto itself does nothing.
void copy_image_file(const std::filesystem::path& from, const std::filesystem::path& to);

void make_directories(const std::filesystem::path& path);

// Expands a command line argument into annotation files: a regular file is returned as is,
// a directory is searched recursively for .json files, sorted by path.
std::vector<std::filesystem::path> find_annotation_files(const std::filesystem::path& path);

#endif  // utils_h_INCLUDED
