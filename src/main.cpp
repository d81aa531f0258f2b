#include "AndesCamera.hpp"
#include "CameraErrors.hpp"
#include "ContinuousCapture.hpp"
#include "FrameWriter.hpp"
#include "Log.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

using namespace andes;

struct Options {
    std::string config_path;
    int bin_x = 1;
    int bin_y = 1;
    int exposure_ms = -1;
    bool dark = false;
    bool has_roi = false;
    int roi[4] = {0, 0, 0, 0};
    int gain = -1;
    size_t count = 1;
    std::string output = "frame";
    bool dump_bytecode = false;
    bool verbose = false;
};

static void print_usage(const char* name) {
    fprintf(stderr,
            "Usage: %s [--config profile.json] [--bin X Y] [--exposure MS] [--dark]\n"
            "          [--roi X Y W H] [--gain G] [--count N] [--output prefix]\n"
            "          [--dump-bytecode] [--verbose]\n",
            name);
}

static int next_int(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value after ") + argv[i]);
    }
    return std::stoi(argv[++i]);
}

static Options parse_arguments(int argc, char* argv[]) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!strcmp(arg, "--config")) {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value after --config");
            opt.config_path = argv[++i];
        } else if (!strcmp(arg, "--bin")) {
            opt.bin_x = next_int(argc, argv, i);
            opt.bin_y = next_int(argc, argv, i);
        } else if (!strcmp(arg, "--exposure")) {
            opt.exposure_ms = next_int(argc, argv, i);
        } else if (!strcmp(arg, "--dark")) {
            opt.dark = true;
        } else if (!strcmp(arg, "--roi")) {
            opt.has_roi = true;
            for (int k = 0; k < 4; ++k) {
                opt.roi[k] = next_int(argc, argv, i);
            }
        } else if (!strcmp(arg, "--gain")) {
            opt.gain = next_int(argc, argv, i);
        } else if (!strcmp(arg, "--count")) {
            int count = next_int(argc, argv, i);
            if (count < 1) throw std::invalid_argument("--count must be at least 1");
            opt.count = (size_t) count;
        } else if (!strcmp(arg, "--output")) {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value after --output");
            opt.output = argv[++i];
        } else if (!strcmp(arg, "--dump-bytecode")) {
            opt.dump_bytecode = true;
        } else if (!strcmp(arg, "--verbose")) {
            opt.verbose = true;
        } else {
            throw std::invalid_argument(std::string("Unknown option ") + arg);
        }
    }
    return opt;
}

// Works on both AndesCamera and a bare CameraConfig.
template <typename Settings>
static void stage_settings(Settings& target, const Options& opt) {
    target.set_binning(opt.bin_x, opt.bin_y);
    if (opt.has_roi) {
        target.set_roi(opt.roi[0], opt.roi[1], opt.roi[2], opt.roi[3]);
    }
    if (opt.exposure_ms >= 0) {
        target.set_exposure_time(opt.exposure_ms);
    }
    if (opt.gain >= 0) {
        target.set_gain(opt.gain);
    }
    target.set_shutter(!opt.dark);
}

static int run_capture(AndesCamera& camera, const Options& opt) {
    camera.open();
    camera.power_on(true);
    camera.configure_temperature();
    dprintf("Sensor temperature: %.1f C\n", camera.get_temperature());
    camera.configure();

    FrameWriter writer(opt.output);
    ContinuousCapture stream(camera.pipeline());
    stream.start(opt.count);

    while (writer.frame_count() < (int) opt.count) {
        std::optional<Frame> frame = stream.frames().pop(std::chrono::milliseconds(200));
        if (frame) {
            writer.write(*frame);
        } else if (stream.frames().is_closed()) {
            break;
        }
    }
    stream.stop();

    if (stream.frames().dropped() > 0) {
        dprintf("Warning: %zu frame(s) dropped because saving fell behind.\n", stream.frames().dropped());
    }
    if (std::exception_ptr error = stream.last_error()) {
        std::rethrow_exception(error);
    }

    camera.close();
    dprintf("Captured %d frame(s).\n", writer.frame_count());
    return 0;
}

int main(int argc, char* argv[]) {
    Options opt;
    try {
        opt = parse_arguments(argc, argv);
    } catch (const std::exception& e) {
        fprintf(stderr, "%s\n", e.what());
        print_usage(argv[0]);
        return 1;
    }
    set_verbose(opt.verbose);

    try {
        DeviceProfile profile = opt.config_path.empty() ? DeviceProfile::defaults()
                                                        : DeviceProfile::from_file(opt.config_path);

        if (opt.dump_bytecode) {
            CameraConfig config(profile.sensor);
            stage_settings(config, opt);

            ByteCode formatter;
            std::vector<Command> commands = formatter.encode(config, config.diff(std::nullopt));
            commands.push_back(formatter.trigger(profile.sequencer.stop_cleaning, profile.sequencer.get_image,
                                                 config.shutter().open));
            printf("%s\n", ByteCode::as_legacy_file(commands).c_str());
            return 0;
        }

        AndesCamera camera(profile);
        stage_settings(camera, opt);
        return run_capture(camera, opt);
    } catch (const PermissionDenied& e) {
        dprintf("Error: %s\n", e.what());
        return 2;
    } catch (const std::exception& e) {
        dprintf("Error: %s\n", e.what());
        return -1;
    }
}
