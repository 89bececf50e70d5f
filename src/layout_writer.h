#ifndef layout_writer_h_INCLUDED
#define layout_writer_h_INCLUDED

#include "annotation_parsers.h"
#include "dataset.h"
#include "image_resolver.h"
#include "yolo_format.h"

#include <dlib/rand.h>
#include <filesystem>
#include <iostream>
#include <vector>

struct conversion_options
{
    annotation_format format = annotation_format::damm;
    // fraction of the images that go to the training set
    double train_split = 0.8;
    bool create_classes = true;
    // write {train,val}/{images,labels} instead of a flat directory of label files
    bool yolo_structure = false;
    bool show_progress = false;
};

struct conversion_summary
{
    size_t num_files = 0;
    size_t num_images = 0;
    size_t num_annotations = 0;
    size_t num_labels = 0;
    size_t num_train = 0;
    size_t num_val = 0;
    size_t num_missing = 0;
    size_t num_classes = 0;
};

std::ostream& operator<<(std::ostream& out, const conversion_summary& item);

// Writes the label file of an image into labels_dir and returns its path.
std::filesystem::path write_label_file(
    const std::filesystem::path& labels_dir,
    const unified_image& image);

// One label file per image directly in output_path.
void write_flat_layout(
    const std::vector<unified_image>& images,
    const std::filesystem::path& output_path,
    class_index& classes,
    conversion_summary& summary,
    std::ostream& out = std::cout,
    const bool show_progress = false);

// Splits the images and writes output_path/{train,val}/{images,labels}.  Images that cannot
// be resolved are counted in summary.num_missing and get neither a copy nor a label file.
void write_yolo_layout(
    std::vector<unified_image> images,
    const image_resolver& resolver,
    const std::filesystem::path& output_path,
    const double train_split,
    dlib::rand& rnd,
    class_index& classes,
    conversion_summary& summary,
    std::ostream& out = std::cout,
    const bool show_progress = false);

// Runs the whole conversion: decodes every annotation file, writes the requested layout and
// the classes.txt file.  Any decoding or I/O error aborts the run, files already written are
// left in place.
conversion_summary convert_dataset(
    const std::vector<std::filesystem::path>& annotation_files,
    const std::filesystem::path& image_root,
    const std::filesystem::path& output_path,
    const conversion_options& options,
    dlib::rand& rnd,
    std::ostream& out = std::cout);

#endif  // layout_writer_h_INCLUDED
