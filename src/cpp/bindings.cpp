#include <pybind11/pybind11.h>
#include <pybind11/stl.h>       // 用于 std::vector, std::optional 的自动转换
#include <pybind11/numpy.h>     // 用于 NumPy 数组
#include <cstddef>
#include <cstring>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "reader.hpp"

namespace py = pybind11;
using namespace molly;

#ifdef _WIN32
// Windows doesn't have POSIX ssize_t; use ptrdiff_t which is a signed
// integer type able to represent pointer differences.
using ssize_t = std::ptrdiff_t;
#endif

// molly.XtcError 的 Python 类型，由模块持有
static py::handle xtc_error_type;

// 帮助函数：positions 的 (N, 3) float32 视图 (零拷贝)，由 Python 端的 Frame 对象维持生命周期
static py::array_t<float> make_positions_array(py::object self) {
    const Frame& f = self.cast<const Frame&>();
    return py::array_t<float>(
        {(ssize_t)f.n_atoms, (ssize_t)3},
        {sizeof(float) * 3, sizeof(float)},
        f.positions.data(),
        self
    );
}

// 帮助函数：box 的 (3, 3) float32 拷贝
static py::array_t<float> make_box_array(const Frame& f) {
    py::array_t<float> arr({3, 3});
    float* ptr = static_cast<float*>(arr.mutable_data());
    // std::array<std::array<...>> 内存连续
    std::memcpy(ptr, f.box.data(), 9 * sizeof(float));
    return arr;
}

// 帧选择：None -> 全部帧，slice -> 区间，整数序列 -> 帧号列表
static FrameSelection to_frame_selection(const py::object& obj) {
    if (obj.is_none()) {
        return FrameSelection::all();
    }
    if (py::isinstance<py::slice>(obj)) {
        auto bound = [&](const char* name) -> std::optional<std::int64_t> {
            py::object v = obj.attr(name);
            if (v.is_none()) return std::nullopt;
            return v.cast<std::int64_t>();
        };
        py::object step = obj.attr("step");
        return FrameSelection::range(bound("start"), bound("stop"),
                                     step.is_none() ? 1 : step.cast<std::int64_t>());
    }
    return FrameSelection::list(obj.cast<std::vector<std::size_t>>());
}

// 原子选择：None -> 全部原子，int -> 前 n 个原子，bool 数组 -> 掩码，整数序列 -> 原子索引
static AtomSelection to_atom_selection(const py::object& obj) {
    if (obj.is_none()) {
        return AtomSelection::all();
    }
    if (py::isinstance<py::int_>(obj)) {
        return AtomSelection::until(obj.cast<std::size_t>());
    }
    if (py::isinstance<py::array>(obj) && obj.cast<py::array>().dtype().kind() == 'b') {
        return AtomSelection::mask(obj.cast<std::vector<bool>>());
    }
    return AtomSelection::indices(obj.cast<std::vector<std::size_t>>());
}

// 可写、C 连续的三维 float32 数组，不做拷贝
static ArrayView3 to_view(const char* name, py::array& arr) {
    if (!py::isinstance<py::array_t<float>>(arr) || arr.ndim() != 3 ||
        !(arr.flags() & py::array::c_style) || !arr.writeable()) {
        throw XtcError(ErrorKind::ShapeMismatch,
                       std::string(name) + " must be a writable C-contiguous float32 array of rank 3");
    }
    ArrayView3 view;
    view.data = static_cast<float*>(arr.mutable_data());
    for (int i = 0; i < 3; ++i) {
        view.shape[i] = static_cast<std::size_t>(arr.shape(i));
    }
    return view;
}

PYBIND11_MODULE(_molly, m) {
    m.doc() = "Fast xtc trajectory reader with frame and atom selection";

    // -----------------------------------------------------------------------
    // XtcError
    // -----------------------------------------------------------------------
    // 抛出 molly.XtcError (RuntimeError 的子类)，
    // 带有 `kind`, `frame`, `rows_valid` 属性。
    xtc_error_type = py::exception<XtcError>(m, "XtcError", PyExc_RuntimeError).release();
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const XtcError& e) {
            py::object type = py::reinterpret_borrow<py::object>(xtc_error_type);
            py::object instance = type(e.what());
            instance.attr("kind") = error_kind_name(e.kind());
            instance.attr("frame") = e.has_frame() ? py::object(py::int_(e.frame())) : py::object(py::none());
            instance.attr("rows_valid") = e.rows_valid();
            PyErr_SetObject(type.ptr(), instance.ptr());
        }
    });

    // -----------------------------------------------------------------------
    // 绑定 Frame 结构
    // -----------------------------------------------------------------------
    py::class_<Frame>(m, "Frame")
        .def(py::init<>())
        .def_readonly("n_atoms", &Frame::n_atoms,
            "Number of atoms held by this frame (after atom selection).")
        .def_readonly("step", &Frame::step,
            "Simulation step of this frame.")
        .def_readonly("time", &Frame::time,
            "Simulation time of this frame.")
        .def_readonly("precision", &Frame::precision,
            "Compression precision; 0 for frames stored uncompressed.")
        .def_property_readonly("box",
            &make_box_array,
            "Box vectors as a (3, 3) NumPy array (copy).")
        .def_property_readonly("positions",
            &make_positions_array,
            "Atom positions as an (N, 3) NumPy array (view into the frame).");

    // -----------------------------------------------------------------------
    // 绑定 FrameStream (XTCReader.read_frames 返回的迭代器)
    // -----------------------------------------------------------------------
    py::class_<FrameStream>(m, "FrameStream")
        .def("__iter__", [](FrameStream& s) -> FrameStream& { return s; })
        .def("__next__", [](FrameStream& s) {
            std::optional<Frame> frame;
            {
                py::gil_scoped_release release;
                frame = s.next();
            }
            if (!frame) throw py::stop_iteration();
            return std::move(*frame);
        })
        .def("__len__", &FrameStream::remaining)
        .def_property_readonly("frames", &FrameStream::frames,
            "Frame numbers this stream visits, in order.");

    // -----------------------------------------------------------------------
    // 绑定 XTCReader
    // -----------------------------------------------------------------------
    py::class_<XTCReader>(m, "XTCReader")
        // def __init__(self, filename: str)
        .def(py::init<const std::string&>(),
             py::arg("filename"),
             "Open and mmap an xtc trajectory.")

        .def_property_readonly("n_frames",
             [](XTCReader& r) {
                 py::gil_scoped_release release;
                 return r.frame_count();
             },
             "Number of frames (builds the frame index on first use).")
        .def_property_readonly("n_atoms", &XTCReader::atom_count,
             "Number of atoms in the first frame.")
        .def_property_readonly("filename", &XTCReader::filename)

        // def pop_frame(self) -> Frame
        .def("pop_frame", &XTCReader::pop_frame,
             py::call_guard<py::gil_scoped_release>(),
             "Decode the next frame in file order.")
        .def("home", &XTCReader::home,
             "Rewind pop_frame to the first frame.")

        // def read_frame(self, frame: int) -> Frame
        .def("read_frame", &XTCReader::read_frame,
             py::call_guard<py::gil_scoped_release>(),
             py::arg("frame"),
             "Decode a single frame by number.")

        // def read_frames(self, frame_selection=None, atom_selection=None) -> FrameStream
        .def("read_frames",
             [](XTCReader& r, const py::object& frames, const py::object& atoms) {
                 FrameSelection frame_sel = to_frame_selection(frames);
                 AtomSelection atom_sel = to_atom_selection(atoms);
                 py::gil_scoped_release release;
                 return r.read_frames(frame_sel, atom_sel);
             },
             py::arg("frame_selection") = py::none(), py::arg("atom_selection") = py::none(),
             py::keep_alive<0, 1>(),
             "Lazily decode the selected frames.\n"
             "frame_selection: None, a slice or a list of frame numbers.\n"
             "atom_selection: None, an int (first n atoms), a bool mask or a list of atom indices.")

        // def read_into_array(self, positions, boxes, frame_selection=None, atom_selection=None) -> int
        .def("read_into_array",
             [](XTCReader& r, py::array positions, py::array boxes,
                const py::object& frames, const py::object& atoms) {
                 ArrayView3 pos_view = to_view("positions", positions);
                 ArrayView3 box_view = to_view("boxes", boxes);
                 FrameSelection frame_sel = to_frame_selection(frames);
                 AtomSelection atom_sel = to_atom_selection(atoms);
                 py::gil_scoped_release release;
                 return r.read_into_array(pos_view, box_view, frame_sel, atom_sel);
             },
             py::arg("positions"), py::arg("boxes"),
             py::arg("frame_selection") = py::none(), py::arg("atom_selection") = py::none(),
             "Decode the selected frames into float32 arrays shaped\n"
             "(n_frames, n_atoms, 3) and (n_frames, 3, 3). Frames are decoded in parallel.")

        // def refresh(self)
        .def("refresh", &XTCReader::refresh,
             py::call_guard<py::gil_scoped_release>(),
             "Remap the file and index frames appended since the last scan.")

        // def save_index(self, cache_filename: str)
        .def("save_index", &XTCReader::save_index,
             py::call_guard<py::gil_scoped_release>(),
             py::arg("cache_filename"),
             "Saves the frame index to a binary cache file.")

        // def load_index(self, cache_filename: str)
        .def("load_index", &XTCReader::load_index,
             py::call_guard<py::gil_scoped_release>(),
             py::arg("cache_filename"),
             "Loads the frame index from a binary cache file, skipping the scan.")

        .def("close", &XTCReader::close,
             "Release the file mapping.");
}
