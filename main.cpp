#include "cat_printer.hpp"
#include "cli_options.hpp"
#include "dither.hpp"
#include "errors.hpp"
#include "print_queue.hpp"
#include "preview.hpp"

#include <iostream>
#include <string>
#include <vector>

// Upper bounds for command line values
static const int MAX_COPIES = 100;
static const int MAX_SCAN_SECONDS = 600;
static const int MAX_CHUNK_SIZE = 512;  // largest ATT attribute value
static const int MAX_CHUNK_DELAY_MS = 10000;
static const int MAX_MIN_HEIGHT = 10000;

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <image_path> [options]\n"
              << "       " << prog << " --text \"<message>\" [options]\n"
              << "\n"
              << "Bluetooth thermal receipt printer (384 dot) uploader\n"
              << "\n"
              << "Options:\n"
              << "  --text <message>         Print text instead of an image\n"
              << "  --dither <atkinson|none> Dithering algorithm (default: atkinson)\n"
              << "  --bg <white|black>       Background for transparent pixels (default: white)\n"
              << "  --preview <file.png>     Write the bitmap that will be printed\n"
              << "  --dry-run                Render (and preview) only, do not print\n"
              << "  --copies <n>             Number of copies (default: 1)\n"
              << "\n"
              << "Printer:\n"
              << "  --energy <n>             Print head energy (default: 12000)\n"
              << "  --quality <n>            Print quality 49-53 (default: 51)\n"
              << "  --feed <lines>           Paper fed after printing (default: 40, sent twice)\n"
              << "  --retract <lines>        Pull paper back before printing (default: 0, off)\n"
              << "  --rows-per-command <n>   Scanlines per bitmap command, 1-5 (default: 1)\n"
              << "  --no-invert              Do not invert bit polarity when packing\n"
              << "  --no-mirror              Do not mirror rows when packing\n"
              << "\n"
              << "Connection:\n"
              << "  --name <prefix>          Printer name prefix, repeatable (default: GB0, MX, YT)\n"
              << "  --address <xx:xx:..>     Connect to this device instead of scanning by name\n"
              << "  --service <uuid>         Advertised service filter, \"\" for none (default: ae30)\n"
              << "  --char <uuid>            Write characteristic (default: ae01)\n"
              << "  --scan-timeout <s>       Discovery timeout in seconds (default: 10)\n"
              << "  --chunk-size <n>         Bytes per write (default: 64)\n"
              << "  --chunk-delay <ms>       Delay between writes (default: 20)\n"
              << "\n"
              << "Text:\n"
              << "  --font <file.ttf>        Monospace TrueType font\n"
              << "  --font-size <px>         Font size (default: 16)\n"
              << "  --line-height <ratio>    Line height as a multiple of font size (default: 1.15)\n"
              << "  --min-height <px>        Minimum text bitmap height (default: 32)\n"
              << "  --help                   Show this help message\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Parse arguments
    std::string image_path;
    std::string text;
    bool text_mode = false;
    std::string bg_name = "white";
    std::string dither_name = "atkinson";
    std::string preview_path;
    bool dry_run = false;
    int copies = 1;

    RenderSettings render;
    JobSettings job;
    TransportSettings transport;
    BleTarget target;
    std::vector<std::string> names;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        bool ok = true;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--text" && has_value) {
            text = argv[++i];
            text_mode = true;
        } else if (arg == "--dither" && has_value) {
            dither_name = argv[++i];
        } else if (arg == "--bg" && has_value) {
            bg_name = argv[++i];
        } else if (arg == "--preview" && has_value) {
            preview_path = argv[++i];
        } else if (arg == "--dry-run") {
            dry_run = true;
        } else if (arg == "--copies" && has_value) {
            ok = parse_integer(argv[++i], 1, MAX_COPIES, copies);
        } else if (arg == "--energy" && has_value) {
            ok = parse_integer(argv[++i], 0, 0xFFFF, job.energy);
        } else if (arg == "--quality" && has_value) {
            ok = parse_integer(argv[++i], QUALITY_MIN, QUALITY_MAX, job.quality);
        } else if (arg == "--feed" && has_value) {
            ok = parse_integer(argv[++i], 0, 0xFFFF, job.feed_lines);
        } else if (arg == "--retract" && has_value) {
            ok = parse_integer(argv[++i], 0, 0xFFFF, job.retract_lines);
        } else if (arg == "--rows-per-command" && has_value) {
            ok = parse_integer(argv[++i], 1, MAX_ROWS_PER_COMMAND, job.rows_per_command);
        } else if (arg == "--no-invert") {
            job.pack.invert = false;
        } else if (arg == "--no-mirror") {
            job.pack.mirror = false;
        } else if (arg == "--name" && has_value) {
            names.push_back(argv[++i]);
        } else if (arg == "--address" && has_value) {
            target.address = argv[++i];
        } else if (arg == "--service" && has_value) {
            target.service_uuid = argv[++i];
        } else if (arg == "--char" && has_value) {
            target.characteristic_uuid = argv[++i];
        } else if (arg == "--scan-timeout" && has_value) {
            int seconds;
            ok = parse_integer(argv[++i], 1, MAX_SCAN_SECONDS, seconds);
            if (ok) target.scan_timeout_ms = seconds * 1000;
        } else if (arg == "--chunk-size" && has_value) {
            ok = parse_integer(argv[++i], 1, MAX_CHUNK_SIZE, transport.chunk_size);
        } else if (arg == "--chunk-delay" && has_value) {
            ok = parse_integer(argv[++i], 0, MAX_CHUNK_DELAY_MS, transport.chunk_delay_ms);
        } else if (arg == "--font" && has_value) {
            render.text.font_path = argv[++i];
        } else if (arg == "--font-size" && has_value) {
            ok = parse_decimal(argv[++i], 1.0, 256.0, render.text.font_size);
        } else if (arg == "--line-height" && has_value) {
            ok = parse_decimal(argv[++i], 0.5, 10.0, render.text.line_height);
        } else if (arg == "--min-height" && has_value) {
            ok = parse_integer(argv[++i], 0, MAX_MIN_HEIGHT, render.text.min_height);
        } else if (arg[0] != '-') {
            image_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }

        if (!ok) {
            std::cerr << "Invalid value for " << arg << ": " << argv[i] << std::endl;
            return 1;
        }
    }

    if (!names.empty()) {
        target.name_prefixes = names;
    }

    // Determine background color
    Color bg_color = COLOR_WHITE;
    if (bg_name == "black") {
        bg_color = COLOR_BLACK;
    } else if (bg_name != "white") {
        std::cerr << "Unknown background color: " << bg_name << std::endl;
        return 1;
    }

    if (dither_name == "atkinson") {
        render.dither = DitherMethod::Atkinson;
    } else if (dither_name == "none") {
        render.dither = DitherMethod::None;
    } else {
        std::cerr << "Unknown dither method: " << dither_name << std::endl;
        return 1;
    }

    if (!text_mode && image_path.empty()) {
        std::cerr << "Error: Please specify an image file or --text." << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        PrinterConnection connection(target, create_ble_link);
        CatPrinter printer(connection, transport);
        PrintSpooler spooler(printer);
        PrintService service(spooler, render, job);

        // Render first so input errors surface before any radio work
        MonoBitmap bitmap;
        if (text_mode) {
            std::cout << "Rendering text..." << std::endl;
            bitmap = service.render_text(text);
        } else {
            std::cout << "Loading: " << image_path << std::endl;
            std::cout << "Options: bg=" << bg_name << ", dither=" << dither_name << std::endl;
            bitmap = service.render_image(load_image(image_path.c_str(), bg_color));
        }
        std::cout << "Bitmap: " << bitmap.width << "x" << bitmap.height << std::endl;

        if (!preview_path.empty()) {
            service.set_preview([&](const MonoBitmap& shown) {
                write_preview_png(shown, preview_path);
                std::cout << "Preview written to " << preview_path << std::endl;
            });
        }

        if (dry_run) {
            if (!preview_path.empty()) {
                write_preview_png(bitmap, preview_path);
                std::cout << "Preview written to " << preview_path << std::endl;
            }
            std::cout << "Dry run, nothing sent." << std::endl;
            return 0;
        }

        std::vector<std::future<void>> results;
        for (int c = 0; c < copies; c++) {
            results.push_back(service.print_bitmap(bitmap, text_mode));
            service.set_preview(nullptr);  // one preview is enough
        }

        for (size_t c = 0; c < results.size(); c++) {
            results[c].get();
            std::cout << "Copy " << (c + 1) << "/" << results.size() << " done" << std::endl;
        }
        std::cout << "Done!" << std::endl;

    } catch (const PrintError& e) {
        std::cerr << user_message(e) << std::endl;
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
