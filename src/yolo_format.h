#ifndef yolo_format_h_INCLUDED
#define yolo_format_h_INCLUDED

#include "dataset.h"

#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

// Box in center form, every value is a fraction of the image dimensions.  Nothing forces the
// values into [0, 1]: a box that leaves the image yields out of range fractions.
struct yolo_annotation
{
    unsigned long class_id = 0;
    double x_center = 0;
    double y_center = 0;
    double width = 0;
    double height = 0;
};

// Converts a corner-form box in pixels into a normalized center-form box.  The image size is
// trusted: a zero dimension produces non-finite values.
yolo_annotation to_center_form(
    const dlib::drectangle& rect,
    const double image_width,
    const double image_height);

yolo_annotation to_yolo_annotation(
    const unified_annotation& annotation,
    const unified_image& image);

// "<class_id> <x_center> <y_center> <width> <height>" with 6 decimal places
std::ostream& operator<<(std::ostream& out, const yolo_annotation& item);

// Contents of the label file for an image: one line per annotation, in the original order,
// each one terminated by a newline.  An image without annotations gives an empty string.
std::string format_labels(const unified_image& image);

class class_index
{
    public:
    void add(const unsigned long category_id);
    void add(const unified_image& image);
    bool empty() const { return names_.empty(); }
    size_t size() const { return names_.size(); }

    // synthesized names sorted by category id
    std::vector<std::string> names() const;

    // one name per line with a trailing newline
    void save(const std::filesystem::path& path) const;

    private:
    std::map<unsigned long, std::string> names_;
};

#endif  // yolo_format_h_INCLUDED
