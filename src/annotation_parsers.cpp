#include "annotation_parsers.h"

#include "utils.h"

#include <map>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    const json& require_field(const json& node, const char* key, const std::string& where)
    {
        if (not node.is_object())
            throw parse_error(where + ": expected an object");
        const auto it = node.find(key);
        if (it == node.end())
            throw parse_error(where + ": missing required field '" + key + "'");
        return *it;
    }

    unsigned long require_unsigned(const json& node, const char* key, const std::string& where)
    {
        const auto& value = require_field(node, key, where);
        if (not value.is_number_unsigned())
            throw parse_error(where + ": '" + key + "' must be a non-negative integer");
        return value.get<unsigned long>();
    }

    std::string require_string(const json& node, const char* key, const std::string& where)
    {
        const auto& value = require_field(node, key, where);
        if (not value.is_string())
            throw parse_error(where + ": '" + key + "' must be a string");
        return value.get<std::string>();
    }

    const json& require_array(const json& node, const char* key, const std::string& where)
    {
        const auto& value = require_field(node, key, where);
        if (not value.is_array())
            throw parse_error(where + ": '" + key + "' must be an array");
        return value;
    }

    std::vector<double> require_numbers(
        const json& values,
        const size_t count,
        const std::string& where)
    {
        if (not values.is_array() or values.size() != count)
        {
            throw parse_error(
                where + ": expected an array of " + std::to_string(count) + " numbers");
        }
        std::vector<double> numbers;
        numbers.reserve(count);
        for (const auto& v : values)
        {
            if (not v.is_number())
                throw parse_error(where + ": box coordinates must be numbers");
            numbers.push_back(v.get<double>());
        }
        return numbers;
    }

    json parse_document(const std::string& content)
    {
        try
        {
            return json::parse(content);
        }
        catch (const json::parse_error& e)
        {
            throw parse_error(std::string("malformed JSON: ") + e.what());
        }
    }

    std::string element(const std::string& list, const size_t i)
    {
        return list + "[" + std::to_string(i) + "]";
    }
}  // namespace

annotation_format parse_annotation_format(const std::string& name)
{
    if (name == "standard")
        return annotation_format::standard;
    if (name == "damm")
        return annotation_format::damm;
    throw config_error("Invalid format '" + name + "'. Use 'standard' or 'damm'");
}

std::string to_string(const annotation_format format)
{
    switch (format)
    {
    case annotation_format::standard:
        return "standard";
    case annotation_format::damm:
        return "damm";
    }
    return "unknown";
}

std::vector<unified_image> parse_standard(const std::string& content)
{
    const auto data = parse_document(content);
    const auto& images = require_array(data, "images", "document");
    const auto& annotations = require_array(data, "annotations", "document");

    // map each image id to its position in the output, a repeated id replaces the earlier
    // record in place
    std::vector<unified_image> result;
    std::map<unsigned long, size_t> image_index;
    for (size_t i = 0; i < images.size(); ++i)
    {
        const auto where = element("images", i);
        const auto& entry = images[i];
        unified_image image;
        const auto id = require_unsigned(entry, "id", where);
        image.file_name = require_string(entry, "file_name", where);
        image.width = require_unsigned(entry, "width", where);
        image.height = require_unsigned(entry, "height", where);
        const auto [it, inserted] = image_index.emplace(id, result.size());
        if (inserted)
            result.push_back(std::move(image));
        else
            result[it->second] = std::move(image);
    }

    for (size_t i = 0; i < annotations.size(); ++i)
    {
        const auto where = element("annotations", i);
        const auto& entry = annotations[i];
        require_unsigned(entry, "id", where);
        const auto image_id = require_unsigned(entry, "image_id", where);
        const auto category_id = require_unsigned(entry, "category_id", where);
        const auto bbox = require_numbers(require_field(entry, "bbox", where), 4, where + ".bbox");
        const auto it = image_index.find(image_id);
        // annotations that refer to an undeclared image have nowhere to go
        if (it == image_index.end())
            continue;
        const dlib::drectangle rect(bbox[0], bbox[1], bbox[0] + bbox[2], bbox[1] + bbox[3]);
        result[it->second].annotations.emplace_back(rect, category_id);
    }
    return result;
}

std::vector<unified_image> parse_damm(const std::string& content)
{
    const auto data = parse_document(content);
    const auto& records = require_array(data, "annotations", "document");

    std::vector<unified_image> result;
    result.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i)
    {
        const auto where = element("annotations", i);
        const auto& entry = records[i];
        unified_image image;
        image.file_name = require_string(entry, "file_name", where);
        image.width = require_unsigned(entry, "width", where);
        image.height = require_unsigned(entry, "height", where);
        require_unsigned(entry, "image_id", where);
        const auto& boxes = require_array(entry, "annotations", where);
        for (size_t j = 0; j < boxes.size(); ++j)
        {
            const auto box_where = element(where + ".annotations", j);
            const auto& box = boxes[j];
            const auto category_id = require_unsigned(box, "category_id", box_where);
            const auto& corners = require_field(box, "bbox", box_where);
            if (not corners.is_array() or corners.size() != 2)
                throw parse_error(box_where + ".bbox: expected exactly two corner points");
            const auto tl = require_numbers(corners[0], 2, box_where + ".bbox[0]");
            const auto br = require_numbers(corners[1], 2, box_where + ".bbox[1]");
            image.annotations.emplace_back(
                dlib::drectangle(tl[0], tl[1], br[0], br[1]),
                category_id);
        }
        result.push_back(std::move(image));
    }
    return result;
}

std::vector<unified_image> parse_annotations(
    const std::string& content,
    const annotation_format format)
{
    switch (format)
    {
    case annotation_format::standard:
        return parse_standard(content);
    case annotation_format::damm:
        return parse_damm(content);
    }
    throw config_error("unsupported annotation format");
}

std::vector<unified_image> load_annotation_file(
    const std::filesystem::path& path,
    const annotation_format format)
{
    const auto content = read_text_file(path);
    try
    {
        return parse_annotations(content, format);
    }
    catch (const parse_error& e)
    {
        throw parse_error(
            "Failed to parse as " + to_string(format) + " format: " + path.string() + ": " +
            e.what());
    }
}
