#include "yolo_format.h"

#include "utils.h"

#include <iomanip>
#include <sstream>

yolo_annotation to_center_form(
    const dlib::drectangle& rect,
    const double image_width,
    const double image_height)
{
    // drectangle::width() reports 0 for inverted boxes, which must go through untouched
    const double w = rect.right() - rect.left();
    const double h = rect.bottom() - rect.top();
    yolo_annotation result;
    result.x_center = (rect.left() + w / 2.0) / image_width;
    result.y_center = (rect.top() + h / 2.0) / image_height;
    result.width = w / image_width;
    result.height = h / image_height;
    return result;
}

yolo_annotation to_yolo_annotation(
    const unified_annotation& annotation,
    const unified_image& image)
{
    auto result = to_center_form(annotation.rect, image.width, image.height);
    result.class_id = annotation.category_id;
    return result;
}

std::ostream& operator<<(std::ostream& out, const yolo_annotation& item)
{
    const auto flags = out.flags();
    const auto precision = out.precision();
    out << item.class_id << std::fixed << std::setprecision(6) << ' ' << item.x_center << ' '
        << item.y_center << ' ' << item.width << ' ' << item.height;
    out.flags(flags);
    out.precision(precision);
    return out;
}

std::string format_labels(const unified_image& image)
{
    std::ostringstream sout;
    for (const auto& annotation : image.annotations)
        sout << to_yolo_annotation(annotation, image) << '\n';
    return sout.str();
}

void class_index::add(const unsigned long category_id)
{
    names_.emplace(category_id, "class_" + std::to_string(category_id));
}

void class_index::add(const unified_image& image)
{
    for (const auto& annotation : image.annotations)
        add(annotation.category_id);
}

std::vector<std::string> class_index::names() const
{
    std::vector<std::string> result;
    result.reserve(names_.size());
    for (const auto& [id, name] : names_)
        result.push_back(name);
    return result;
}

void class_index::save(const std::filesystem::path& path) const
{
    std::string content;
    for (const auto& name : names())
        content += name + '\n';
    write_text_file(path, content);
}
