#include "layout_writer.h"
#include "utils.h"

#include <ctime>
#include <dlib/cmd_line_parser.h>
#include <dlib/rand.h>

namespace fs = std::filesystem;

auto main(const int argc, const char** argv) -> int
try
{
    dlib::command_line_parser parser;
    parser.add_option("format", "annotation format: standard or damm (default: damm)", 1);
    parser.add_option("output", "output directory (default: output)", 1);
    parser.add_option("images", "directory searched for the image files (default: input dir)", 1);
    parser.add_option("no-classes", "do not write the classes.txt file");
    parser.add_option("quiet", "do not display the progress bar");

    parser.set_group_name("Dataset Options");
    parser.add_option("structure", "create {train,val}/{images,labels} and copy the images");
    parser.add_option("split", "fraction of images used for training (default: 0.8)", 1);
    parser.add_option("seed", "random seed for the split (default: current time)", 1);

    parser.set_group_name("Help Options");
    parser.add_option("h", "alias for --help");
    parser.add_option("help", "display this message and exit");
    parser.parse(argc, argv);
    const bool help = parser.option("h") or parser.option("help");
    if (parser.number_of_arguments() == 0 or help)
    {
        std::cout << "Usage: " << argv[0] << " [OPTION]… PATH/TO/ANNOTATIONS…\n";
        parser.print_options();
        std::cout << "Each path is a JSON annotation file or a directory searched for them.\n";
        return help ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    parser.check_option_arg_range<double>("split", 0, 1);
    parser.check_sub_option("structure", "split");
    parser.check_sub_option("structure", "seed");

    conversion_options options;
    options.format = parse_annotation_format(dlib::get_option(parser, "format", "damm"));
    options.train_split = dlib::get_option(parser, "split", 0.8);
    options.create_classes = not parser.option("no-classes");
    options.yolo_structure = parser.option("structure");
    options.show_progress = not parser.option("quiet");
    const fs::path output_path = dlib::get_option(parser, "output", "output");

    std::vector<fs::path> annotation_files;
    for (size_t i = 0; i < parser.number_of_arguments(); ++i)
    {
        const auto files = find_annotation_files(parser[i]);
        annotation_files.insert(annotation_files.end(), files.begin(), files.end());
    }

    fs::path image_root = dlib::get_option(parser, "images", "");
    if (image_root.empty())
    {
        image_root = parser[0];
        if (not fs::is_directory(image_root))
            image_root = image_root.has_parent_path() ? image_root.parent_path() : fs::path(".");
    }
    if (options.yolo_structure and not fs::is_directory(image_root))
        throw config_error("Input directory does not exist: " + image_root.string());

    dlib::rand rnd;
    const auto now = static_cast<unsigned long>(std::time(nullptr));
    const unsigned long seed = dlib::get_option(parser, "seed", now);
    rnd.set_seed(std::to_string(seed));

    std::cout << "Converting COCO format to YOLO format...\n";
    std::cout << "Input files: " << annotation_files.size() << '\n';
    std::cout << "Output directory: " << output_path.string() << '\n';
    if (options.yolo_structure)
        std::cout << "Image directory: " << image_root.string() << ", seed: " << seed << '\n';
    std::cout << std::endl;

    convert_dataset(annotation_files, image_root, output_path, options, rnd);
    return EXIT_SUCCESS;
}
catch (const std::exception& e)
{
    std::cerr << e.what() << '\n';
    return EXIT_FAILURE;
}
