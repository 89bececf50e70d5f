#ifndef annotation_parsers_h_INCLUDED
#define annotation_parsers_h_INCLUDED

#include "dataset.h"
#include "errors.h"

#include <filesystem>
#include <string>
#include <vector>

enum class annotation_format
{
    standard,
    damm
};

// Accepts "standard" or "damm", throws config_error otherwise.
annotation_format parse_annotation_format(const std::string& name);

std::string to_string(const annotation_format format);

// Standard layout: an "images" list and a flat "annotations" list that refers to the images
// by id.  Boxes are [x, y, width, height].  Every declared image is returned, in declaration
// order, even when no annotation refers to it.
std::vector<unified_image> parse_standard(const std::string& content);

// DAMM layout: a top-level "annotations" list of images, each one with its own
// "annotations" list.  Boxes are [[x1, y1], [x2, y2]].
std::vector<unified_image> parse_damm(const std::string& content);

std::vector<unified_image> parse_annotations(
    const std::string& content,
    const annotation_format format);

// Reads and decodes one annotation file.  Read failures throw io_error, decoding failures
// throw parse_error with the file path in the message.
std::vector<unified_image> load_annotation_file(
    const std::filesystem::path& path,
    const annotation_format format);

#endif  // annotation_parsers_h_INCLUDED
