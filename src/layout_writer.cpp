#include "layout_writer.h"

#include "dataset_split.h"
#include "utils.h"

#include <dlib/console_progress_indicator.h>
#include <optional>

namespace fs = std::filesystem;

std::ostream& operator<<(std::ostream& out, const conversion_summary& item)
{
    out << "Processed files: " << item.num_files << '\n';
    out << "Total images: " << item.num_images << '\n';
    out << "Total annotations: " << item.num_annotations << '\n';
    out << "Label files written: " << item.num_labels << '\n';
    out << "Classes: " << item.num_classes << '\n';
    if (item.num_train + item.num_val > 0)
    {
        out << "Train images: " << item.num_train << '\n';
        out << "Val images: " << item.num_val << '\n';
        out << "Missing images: " << item.num_missing << '\n';
    }
    return out;
}

fs::path write_label_file(const fs::path& labels_dir, const unified_image& image)
{
    const auto label_path = labels_dir / (base_name_without_extension(image.file_name) + ".txt");
    write_text_file(label_path, format_labels(image));
    return label_path;
}

void write_flat_layout(
    const std::vector<unified_image>& images,
    const fs::path& output_path,
    class_index& classes,
    conversion_summary& summary,
    std::ostream& out,
    const bool show_progress)
{
    make_directories(output_path);
    dlib::console_progress_indicator progress(images.size());
    size_t cnt = 0;
    for (const auto& image : images)
    {
        const auto label_path = write_label_file(output_path, image);
        classes.add(image);
        ++summary.num_labels;
        out << "  -> Generated: " << label_path.string() << " (" << image.annotations.size()
            << " annotations)\n";
        if (show_progress)
            progress.print_status(++cnt, false, std::clog);
    }
}

void write_yolo_layout(
    std::vector<unified_image> images,
    const image_resolver& resolver,
    const fs::path& output_path,
    const double train_split,
    dlib::rand& rnd,
    class_index& classes,
    conversion_summary& summary,
    std::ostream& out,
    const bool show_progress)
{
    for (const auto set : {"train", "val"})
    {
        make_directories(output_path / set / "images");
        make_directories(output_path / set / "labels");
    }

    const auto num_images = images.size();
    const auto split = split_dataset(std::move(images), train_split, rnd);
    summary.num_train = split.train.size();
    summary.num_val = split.val.size();
    out << "Split: " << summary.num_train << " train, " << summary.num_val << " val\n";

    dlib::console_progress_indicator progress(num_images);
    size_t cnt = 0;
    const auto process = [&](const std::vector<unified_image>& subset, const fs::path& set_dir)
    {
        for (const auto& image : subset)
        {
            if (show_progress)
                progress.print_status(++cnt, false, std::clog);
            const auto source = resolver.resolve(image.file_name);
            if (not source)
            {
                ++summary.num_missing;
                out << "Missing image: " << image.file_name << '\n';
                continue;
            }
            copy_image_file(*source, set_dir / "images" / source->filename());
            const auto label_path = write_label_file(set_dir / "labels", image);
            classes.add(image);
            ++summary.num_labels;
            out << "  -> Generated: " << label_path.string() << " ("
                << image.annotations.size() << " annotations)\n";
        }
    };
    process(split.train, output_path / "train");
    process(split.val, output_path / "val");
    if (summary.num_missing > 0)
        out << "Images not found: " << summary.num_missing << '\n';
}

conversion_summary convert_dataset(
    const std::vector<fs::path>& annotation_files,
    const fs::path& image_root,
    const fs::path& output_path,
    const conversion_options& options,
    dlib::rand& rnd,
    std::ostream& out)
{
    if (annotation_files.empty())
        throw config_error("No annotation files to convert");

    // index the images before touching the output, a bad root is a configuration error.
    // Copies left by an earlier run are not sources.
    std::optional<image_resolver> resolver;
    if (options.yolo_structure)
    {
        const std::vector<fs::path> generated{output_path / "train", output_path / "val"};
        resolver.emplace(image_root, generated);
        out << "Indexed " << resolver->size() << " files under " << image_root.string() << '\n';
    }

    make_directories(output_path);
    out << "Using format: " << to_string(options.format) << '\n';

    conversion_summary summary;
    std::vector<unified_image> images;
    for (const auto& path : annotation_files)
    {
        out << "Processing: " << path.string() << '\n';
        auto parsed = load_annotation_file(path, options.format);
        for (auto& image : parsed)
        {
            summary.num_annotations += image.annotations.size();
            images.push_back(std::move(image));
        }
        ++summary.num_files;
    }
    summary.num_images = images.size();
    out << "Found " << summary.num_images << " images\n";

    class_index classes;
    if (options.yolo_structure)
    {
        write_yolo_layout(
            std::move(images),
            *resolver,
            output_path,
            options.train_split,
            rnd,
            classes,
            summary,
            out,
            options.show_progress);
    }
    else
    {
        write_flat_layout(images, output_path, classes, summary, out, options.show_progress);
    }

    summary.num_classes = classes.size();
    if (options.create_classes and not classes.empty())
    {
        const auto classes_path = output_path / "classes.txt";
        classes.save(classes_path);
        out << "Generated classes file: " << classes_path.string() << '\n';
    }

    out << "\nConversion completed!\n" << summary;
    return summary;
}
