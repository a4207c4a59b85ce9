#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "viewmark/controller.hpp"
#include "viewmark/log.hpp"
#include "viewmark/snapshot.hpp"
#include "viewmark/viewport.hpp"

namespace {

struct Args {
    std::string config_path;
    std::string store_path;
    std::string context;
    std::string context_path;
    bool has_context = false;

    // Virtual camera used for capture / nearest / jump
    viewmark::Vec3 camera = viewmark::Vec3::Zero();
    viewmark::Vec3 euler  = viewmark::Vec3::Zero();
    float distance = 10.0f;
    float size = viewmark::DEFAULT_VIEW_SIZE;
    bool orthographic = false;

    bool add = false;
    std::string add_name;

    bool list = false;
    bool list_contexts = false;

    int remove_index = -1;

    int rename_index = -1;
    std::string rename_name;

    int move_from = -1;
    int move_to   = -1;

    int position_index = -1;
    viewmark::Vec3 position = viewmark::Vec3::Zero();

    int euler_index = -1;
    viewmark::Vec3 new_euler = viewmark::Vec3::Zero();

    int jump_index = -1;
    bool nearest = false;
    char hotkey = '\0';

    bool instant = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cout
        << "Usage: " << prog << " [OPTIONS]\n"
        << "\n"
        << "Camera viewpoint bookmarks\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config PATH          Config file (default: ~/.viewmark_config)\n"
        << "  -s, --store PATH           Bookmark file (default: config STORE_PATH)\n"
        << "      --context KEY [PATH]   Scene the bookmarks belong to\n"
        << "\n"
        << "Camera:\n"
        << "      --camera X Y Z         Camera position\n"
        << "      --euler X Y Z          Camera rotation in degrees (Z, X, Y order)\n"
        << "      --distance D           Distance from camera to pivot (default: 10)\n"
        << "      --size S               View size (default: 10)\n"
        << "      --ortho                Orthographic view\n"
        << "\n"
        << "Bookmarks:\n"
        << "      --add [NAME]           Bookmark the camera\n"
        << "      --list                 List bookmarks of the context\n"
        << "      --contexts             List known contexts\n"
        << "      --remove I             Remove bookmark I\n"
        << "      --rename I NAME        Rename bookmark I\n"
        << "      --move I J             Move bookmark I to position J\n"
        << "      --set-position I X Y Z Move the camera of bookmark I\n"
        << "      --set-euler I X Y Z    Turn the camera of bookmark I\n"
        << "\n"
        << "Navigation:\n"
        << "      --jump I               Jump to bookmark I\n"
        << "      --nearest              Jump to the bookmark nearest the look ray\n"
        << "      --hotkey DIGIT         Jump as if Shift+DIGIT was pressed\n"
        << "      --instant              Do not animate jumps\n"
        << "\n"
        << "  -v, --verbose              Debug logging\n"
        << "  -h, --help                 Show this help message\n";
}

bool need(int argc, int i, int count, const std::string& arg) {
    if (i + count >= argc) {
        std::cerr << "Error: " << arg << " requires " << count
                  << (count == 1 ? " argument\n" : " arguments\n");
        return false;
    }
    return true;
}

viewmark::Vec3 read_vec3(char* argv[], int& i) {
    float x = std::stof(argv[++i]);
    float y = std::stof(argv[++i]);
    float z = std::stof(argv[++i]);
    return viewmark::Vec3(x, y, z);
}

bool parse_args(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return true;
        } else if (arg == "-c" || arg == "--config") {
            if (!need(argc, i, 1, arg)) return false;
            args.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--store") {
            if (!need(argc, i, 1, arg)) return false;
            args.store_path = argv[++i];
        } else if (arg == "--context") {
            if (!need(argc, i, 1, arg)) return false;
            args.has_context = true;
            args.context = argv[++i];
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                args.context_path = argv[++i];
            }
        } else if (arg == "--camera") {
            if (!need(argc, i, 3, arg)) return false;
            args.camera = read_vec3(argv, i);
        } else if (arg == "--euler") {
            if (!need(argc, i, 3, arg)) return false;
            args.euler = read_vec3(argv, i);
        } else if (arg == "--distance") {
            if (!need(argc, i, 1, arg)) return false;
            args.distance = std::stof(argv[++i]);
        } else if (arg == "--size") {
            if (!need(argc, i, 1, arg)) return false;
            args.size = std::stof(argv[++i]);
        } else if (arg == "--ortho") {
            args.orthographic = true;
        } else if (arg == "--add") {
            args.add = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                args.add_name = argv[++i];
            }
        } else if (arg == "--list") {
            args.list = true;
        } else if (arg == "--contexts") {
            args.list_contexts = true;
        } else if (arg == "--remove") {
            if (!need(argc, i, 1, arg)) return false;
            args.remove_index = std::stoi(argv[++i]);
        } else if (arg == "--rename") {
            if (!need(argc, i, 2, arg)) return false;
            args.rename_index = std::stoi(argv[++i]);
            args.rename_name = argv[++i];
        } else if (arg == "--move") {
            if (!need(argc, i, 2, arg)) return false;
            args.move_from = std::stoi(argv[++i]);
            args.move_to   = std::stoi(argv[++i]);
        } else if (arg == "--set-position") {
            if (!need(argc, i, 4, arg)) return false;
            args.position_index = std::stoi(argv[++i]);
            args.position = read_vec3(argv, i);
        } else if (arg == "--set-euler") {
            if (!need(argc, i, 4, arg)) return false;
            args.euler_index = std::stoi(argv[++i]);
            args.new_euler = read_vec3(argv, i);
        } else if (arg == "--jump") {
            if (!need(argc, i, 1, arg)) return false;
            args.jump_index = std::stoi(argv[++i]);
        } else if (arg == "--nearest") {
            args.nearest = true;
        } else if (arg == "--hotkey") {
            if (!need(argc, i, 1, arg)) return false;
            args.hotkey = argv[++i][0];
        } else if (arg == "--instant") {
            args.instant = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

void print_vec3(std::ostream& out, const viewmark::Vec3& v) {
    out << "(" << v.x() << ", " << v.y() << ", " << v.z() << ")";
}

void print_pose(const viewmark::Pose& pose) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Pivot: ";
    print_vec3(std::cout, pose.pivot);
    std::cout << "  Rotation: ";
    print_vec3(std::cout, viewmark::rotation_to_euler(pose.rotation));
    std::cout << "  Size: " << pose.size
              << "  Distance: " << pose.distance
              << (pose.orthographic ? "  (ortho)" : "") << "\n";
}

void print_bookmarks(const viewmark::BookmarkStore& store) {
    auto records = store.records();
    const auto& key = store.active_context();
    std::size_t count = records.size();
    std::cout << "Scene " << (key.empty() ? "<no scene>" : key)
              << " (" << count << " Bookmark" << (count == 1 ? "" : "s") << ")\n";

    std::cout << std::fixed << std::setprecision(1);
    for (std::size_t i = 0; i < count; ++i) {
        const auto& bm = records[i];
        std::cout << "  #" << (i + 1) << " " << bm.name << " (pos: ";
        print_vec3(std::cout, bm.camera_position);
        std::cout << ", pivot: ";
        print_vec3(std::cout, bm.pivot);
        std::cout << ")\n";
    }
}

/// Run camera moves to completion the way a host frame loop would.
void run_frames(viewmark::Controller& ctrl) {
    do {
        ctrl.tick();
        if (ctrl.is_animating()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(16));
        }
    } while (ctrl.is_animating());
}

bool report(viewmark::Status status, const std::string& what) {
    if (status == viewmark::Status::OK) {
        return true;
    }
    std::cerr << what << ": " << viewmark::to_string(status) << "\n";
    return false;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Args args;
    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: bad numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    bool mutates =
        args.add || args.remove_index >= 0 || args.rename_index >= 0 ||
        args.move_from >= 0 || args.position_index >= 0 || args.euler_index >= 0;
    bool navigates = args.jump_index >= 0 || args.nearest || args.hotkey != '\0';

    if (!mutates && !navigates && !args.list && !args.list_contexts) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        viewmark::Pose start;
        start.rotation = viewmark::euler_to_rotation(args.euler);
        start.distance = args.distance;
        start.size = args.size;
        start.orthographic = args.orthographic;
        start.pivot = viewmark::reconcile_pivot(args.camera, start.rotation, args.distance);

        auto viewport = std::make_unique<viewmark::VirtualViewport>(start);
        viewmark::Controller ctrl(std::move(viewport), args.config_path, args.store_path);

        if (args.verbose) {
            viewmark::set_log_level("debug");
        }
        if (args.instant) {
            ctrl.config().set_animate(false);
        }
        if (args.has_context) {
            ctrl.open_context(args.context, args.context_path);
        }

        auto& store = ctrl.store();
        bool ok = true;

        if (args.add) {
            std::size_t index = 0;
            ok = report(ctrl.capture(args.add_name, &index), "Cannot add bookmark");
            if (ok) {
                std::cout << "Added bookmark #" << (index + 1) << ": "
                          << store.get(index)->name << "\n";
            }
        } else if (args.remove_index >= 0) {
            ok = report(store.remove_at(static_cast<std::size_t>(args.remove_index)),
                        "Cannot remove bookmark");
        } else if (args.rename_index >= 0) {
            ok = report(store.rename(static_cast<std::size_t>(args.rename_index), args.rename_name),
                        "Cannot rename bookmark");
        } else if (args.move_from >= 0) {
            ok = report(store.reorder(static_cast<std::size_t>(args.move_from),
                                      static_cast<std::size_t>(args.move_to)),
                        "Cannot move bookmark");
        } else if (args.position_index >= 0) {
            ok = report(store.set_position(static_cast<std::size_t>(args.position_index), args.position),
                        "Cannot move camera");
        } else if (args.euler_index >= 0) {
            ok = report(store.set_rotation_euler(static_cast<std::size_t>(args.euler_index), args.new_euler),
                        "Cannot turn camera");
        } else if (args.jump_index >= 0) {
            ok = report(ctrl.jump_to(static_cast<std::size_t>(args.jump_index)), "Cannot jump");
        } else if (args.nearest) {
            std::optional<viewmark::NearestHit> hit;
            ok = report(ctrl.jump_to_nearest(viewmark::Clock::now(), &hit), "Cannot jump");
            if (ok && hit) {
                std::cout << "Nearest look target: #" << (hit->index + 1)
                          << " \"" << store.get(hit->index)->name << "\""
                          << " (score=" << std::fixed << std::setprecision(3)
                          << hit->score << ")\n";
            }
        } else if (args.hotkey != '\0') {
            viewmark::KeyPress key;
            key.digit = args.hotkey;
            key.shift = true;
            ok = report(ctrl.handle_hotkey(key), "Cannot jump");
        }

        run_frames(ctrl);

        if (ok && navigates) {
            print_pose(ctrl.viewport().read_current_pose());
        }
        if (mutates && !ctrl.config().autosave()) {
            ctrl.save();
        }
        if (args.list || (ok && mutates)) {
            print_bookmarks(store);
        }
        if (args.list_contexts) {
            for (const auto& key : store.contexts()) {
                std::cout << "  " << (key.empty() ? "<no scene>" : key)
                          << (key == store.active_context() ? " *" : "")
                          << "  " << store.context_path(key)
                          << "  (" << store.size(key) << ")\n";
            }
        }

        return ok ? 0 : 1;
    } catch (const viewmark::StoreFileError& e) {
        std::cerr << "Store error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
