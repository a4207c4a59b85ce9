#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include <memory>
#include <optional>
#include <string>
#include <tuple>

#include "viewmark/bookmark.hpp"
#include "viewmark/bookmark_store.hpp"
#include "viewmark/constants.hpp"
#include "viewmark/controller.hpp"
#include "viewmark/geometry.hpp"
#include "viewmark/hotkeys.hpp"
#include "viewmark/nearest.hpp"
#include "viewmark/snapshot.hpp"
#include "viewmark/viewport.hpp"

namespace py = pybind11;

// Quaternions cross the boundary as (x, y, z, w) tuples.
static std::tuple<float, float, float, float> quat_to_tuple(const viewmark::Quat& q) {
    return {q.x(), q.y(), q.z(), q.w()};
}

static viewmark::Quat tuple_to_quat(const std::tuple<float, float, float, float>& t) {
    return viewmark::Quat(std::get<3>(t), std::get<0>(t), std::get<1>(t), std::get<2>(t));
}

// Readable status text for log messages on the Python side.
static std::string status_name(viewmark::Status status) {
    return viewmark::to_string(status);
}

PYBIND11_MODULE(_viewmark_native, m) {
    m.doc() = "viewmark native C++ bindings";

    py::enum_<viewmark::Status>(m, "Status")
        .value("OK", viewmark::Status::OK)
        .value("NO_OP", viewmark::Status::NO_OP)
        .value("INDEX_OUT_OF_RANGE", viewmark::Status::INDEX_OUT_OF_RANGE)
        .value("NO_ACTIVE_VIEWPORT", viewmark::Status::NO_ACTIVE_VIEWPORT)
        .value("MALFORMED_SNAPSHOT", viewmark::Status::MALFORMED_SNAPSHOT);
    m.def("status_name", &status_name);

    // Rgba
    py::class_<viewmark::Rgba>(m, "Rgba")
        .def(py::init<>())
        .def(py::init([](float r, float g, float b, float a) {
                 return viewmark::Rgba{r, g, b, a};
             }),
             py::arg("r"), py::arg("g"), py::arg("b"), py::arg("a") = 1.0f)
        .def_readwrite("r", &viewmark::Rgba::r)
        .def_readwrite("g", &viewmark::Rgba::g)
        .def_readwrite("b", &viewmark::Rgba::b)
        .def_readwrite("a", &viewmark::Rgba::a);

    // Pose
    py::class_<viewmark::Pose>(m, "Pose")
        .def(py::init<>())
        .def_readwrite("pivot", &viewmark::Pose::pivot)
        .def_property("rotation",
             [](const viewmark::Pose& p) { return quat_to_tuple(p.rotation); },
             [](viewmark::Pose& p, const std::tuple<float, float, float, float>& t) {
                 p.rotation = tuple_to_quat(t);
             })
        .def_readwrite("size", &viewmark::Pose::size)
        .def_readwrite("orthographic", &viewmark::Pose::orthographic)
        .def_readwrite("distance", &viewmark::Pose::distance);

    // Bookmark
    py::class_<viewmark::Bookmark>(m, "Bookmark")
        .def(py::init<>())
        .def_readwrite("name", &viewmark::Bookmark::name)
        .def_readwrite("pivot", &viewmark::Bookmark::pivot)
        .def_property("rotation",
             [](const viewmark::Bookmark& b) { return quat_to_tuple(b.rotation); },
             [](viewmark::Bookmark& b, const std::tuple<float, float, float, float>& t) {
                 b.rotation = tuple_to_quat(t);
             })
        .def_readwrite("size", &viewmark::Bookmark::size)
        .def_readwrite("orthographic", &viewmark::Bookmark::orthographic)
        .def_readwrite("color", &viewmark::Bookmark::color)
        .def_readwrite("camera_distance", &viewmark::Bookmark::camera_distance)
        .def_readwrite("camera_position", &viewmark::Bookmark::camera_position)
        .def("reconcile", &viewmark::Bookmark::reconcile)
        .def("to_pose", &viewmark::Bookmark::to_pose)
        .def("__eq__", &viewmark::Bookmark::operator==);

    m.def("euler_to_rotation",
          [](const viewmark::Vec3& degrees) {
              return quat_to_tuple(viewmark::euler_to_rotation(degrees));
          }, py::arg("degrees"));

    py::class_<viewmark::NearestHit>(m, "NearestHit")
        .def_readonly("index", &viewmark::NearestHit::index)
        .def_readonly("score", &viewmark::NearestHit::score);

    m.def("nearest_look_target", &viewmark::nearest_look_target,
          py::arg("records"), py::arg("ray_origin"), py::arg("ray_direction"),
          "Bookmark whose pivot is closest to a normalized look ray.");

    m.def("hotkey_index",
          static_cast<std::optional<std::size_t> (*)(char)>(&viewmark::hotkey_index),
          py::arg("digit"));

    // BookmarkStore - only reachable through a Controller, which owns the
    // task queue the store posts its notifications to
    py::class_<viewmark::BookmarkStore>(m, "BookmarkStore")
        .def("set_active_context", &viewmark::BookmarkStore::set_active_context,
             py::arg("key"), py::arg("context_path") = "")
        .def_property_readonly("active_context", &viewmark::BookmarkStore::active_context)
        .def("contexts", &viewmark::BookmarkStore::contexts)
        .def("__len__", [](const viewmark::BookmarkStore& s) { return s.size(); })
        .def("records",
             static_cast<std::vector<viewmark::Bookmark> (viewmark::BookmarkStore::*)() const>(
                 &viewmark::BookmarkStore::records))
        .def("get",
             static_cast<std::optional<viewmark::Bookmark> (viewmark::BookmarkStore::*)(std::size_t) const>(
                 &viewmark::BookmarkStore::get))
        .def("add",
             static_cast<std::size_t (viewmark::BookmarkStore::*)(const viewmark::Bookmark&)>(
                 &viewmark::BookmarkStore::add))
        .def("remove_at",
             static_cast<viewmark::Status (viewmark::BookmarkStore::*)(std::size_t)>(
                 &viewmark::BookmarkStore::remove_at))
        .def("rename",
             static_cast<viewmark::Status (viewmark::BookmarkStore::*)(std::size_t, const std::string&)>(
                 &viewmark::BookmarkStore::rename))
        .def("replace",
             static_cast<viewmark::Status (viewmark::BookmarkStore::*)(std::size_t, const viewmark::Bookmark&)>(
                 &viewmark::BookmarkStore::replace))
        .def("set_position",
             static_cast<viewmark::Status (viewmark::BookmarkStore::*)(std::size_t, const viewmark::Vec3&)>(
                 &viewmark::BookmarkStore::set_position))
        .def("reorder",
             static_cast<viewmark::Status (viewmark::BookmarkStore::*)(std::size_t, std::size_t)>(
                 &viewmark::BookmarkStore::reorder))
        .def("move_to_slot",
             static_cast<viewmark::Status (viewmark::BookmarkStore::*)(std::size_t, std::size_t)>(
                 &viewmark::BookmarkStore::move_to_slot))
        .def("set_rotation_euler",
             static_cast<viewmark::Status (viewmark::BookmarkStore::*)(std::size_t, const viewmark::Vec3&)>(
                 &viewmark::BookmarkStore::set_rotation_euler))
        .def("set_color",
             static_cast<viewmark::Status (viewmark::BookmarkStore::*)(std::size_t, const viewmark::Rgba&)>(
                 &viewmark::BookmarkStore::set_color))
        .def("subscribe", &viewmark::BookmarkStore::subscribe)
        .def("unsubscribe", &viewmark::BookmarkStore::unsubscribe)
        .def("snapshot",
             [](const viewmark::BookmarkStore& s) { return viewmark::encode_snapshot(s); })
        .def("restore",
             [](viewmark::BookmarkStore& s, const std::string& json) {
                 return viewmark::restore_snapshot(s, json);
             });

    // Controller - factory function returning unique_ptr since Controller
    // owns a unique_ptr member (non-copyable, non-movable in pybind11)
    m.def("create_controller",
          [](const std::string& config_path, const std::string& store_path) {
              auto viewport = std::make_unique<viewmark::VirtualViewport>();
              return std::make_unique<viewmark::Controller>(
                  std::move(viewport), config_path, store_path);
          },
          py::arg("config_path") = "", py::arg("store_path") = "");

    py::class_<viewmark::Controller>(m, "Controller")
        .def_property_readonly("store",
             static_cast<viewmark::BookmarkStore& (viewmark::Controller::*)()>(
                 &viewmark::Controller::store),
             py::return_value_policy::reference_internal)
        .def("open_context", &viewmark::Controller::open_context,
             py::arg("key"), py::arg("context_path") = "")
        .def("capture",
             [](viewmark::Controller& c, const std::string& name) {
                 return c.capture(name);
             }, py::arg("name") = "")
        .def("jump_to",
             [](viewmark::Controller& c, std::size_t index) { return c.jump_to(index); })
        .def("jump_to_nearest",
             [](viewmark::Controller& c) { return c.jump_to_nearest(); })
        .def("nearest_to_view", &viewmark::Controller::nearest_to_view)
        .def("read_pose",
             [](viewmark::Controller& c) { return c.viewport().read_current_pose(); })
        .def("set_pose",
             [](viewmark::Controller& c, const viewmark::Pose& pose) {
                 c.viewport().apply_pose(pose, true);
             })
        .def("tick", [](viewmark::Controller& c) { c.tick(); })
        .def("is_animating", &viewmark::Controller::is_animating)
        .def_property("show_markers",
             [](const viewmark::Controller& c) { return c.config().show_markers(); },
             [](viewmark::Controller& c, bool value) { c.config().set_show_markers(value); })
        .def_property("show_labels",
             [](const viewmark::Controller& c) { return c.config().show_labels(); },
             [](viewmark::Controller& c, bool value) { c.config().set_show_labels(value); })
        .def("load", &viewmark::Controller::load)
        .def("save", &viewmark::Controller::save);

    // Constants
    m.attr("DEFAULT_TRANSITION_DURATION") = viewmark::DEFAULT_TRANSITION_DURATION;
    m.attr("BEHIND_PENALTY") = viewmark::BEHIND_PENALTY;
    m.attr("HOTKEY_SLOTS") = viewmark::HOTKEY_SLOTS;
}
