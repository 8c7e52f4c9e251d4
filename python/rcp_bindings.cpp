//
// Created by gregorian-rayne on 10/18/26.
//

/**
 * @file rcp_bindings.cpp
 * @brief Python bindings for the Report Content Pipeline using pybind11.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "rcp/rcp.hpp"

namespace py = pybind11;

namespace {

    PyObject* exception_type_for(const rcp::ErrorCode code) {
        switch (code) {
            case rcp::ErrorCode::NotFound:
                return PyExc_FileNotFoundError;
            case rcp::ErrorCode::NotAFile:
                return PyExc_IsADirectoryError;
            case rcp::ErrorCode::IoError:
                return PyExc_OSError;
            case rcp::ErrorCode::InvalidArgument:
            case rcp::ErrorCode::EmptyInput:
            case rcp::ErrorCode::TooLarge:
            case rcp::ErrorCode::MissingFrontmatter:
            case rcp::ErrorCode::UnterminatedFrontmatter:
            case rcp::ErrorCode::MetadataParseError:
            case rcp::ErrorCode::MissingRequiredField:
            case rcp::ErrorCode::ConfigError:
                return PyExc_ValueError;
            default:
                return PyExc_RuntimeError;
        }
    }

    /**
     * Raises the Python exception matching error. Requires the GIL.
     */
    [[noreturn]] void raise_error(const rcp::Error& error) {
        PyErr_SetString(exception_type_for(error.code()), error.to_string().c_str());
        throw py::error_already_set();
    }

    template<typename T>
    T unwrap_result(rcp::Result<T>&& result) {
        if (result.is_err()) {
            raise_error(result.error());
        }
        return std::move(result).value();
    }

    void unwrap_result(rcp::Result<void>&& result) {
        if (result.is_err()) {
            raise_error(result.error());
        }
    }

    py::dict snapshot_to_dict(const rcp::ProgressSnapshot& snapshot) {
        py::dict d;
        d["percentage"] = snapshot.percentage;
        d["stage"] = snapshot.stage;
        d["agent"] = snapshot.agent;
        d["activity"] = snapshot.activity;
        d["elapsed_seconds"] = snapshot.elapsed_seconds();
        return d;
    }

    py::tuple document_to_tuple(rcp::ExtractedDocument&& doc) {
        return py::make_tuple(py::cast(doc.metadata), py::cast(doc.body));
    }

    rcp::IsolationMode isolation_from(const std::string& name) {
        return unwrap_result(rcp::isolation_mode_from_string(name));
    }

}  // namespace

PYBIND11_MODULE(_rcp_native, m) {
    m.doc() = "Report Content Pipeline - sanitizing, metadata extraction, rendering and storage of reports";

    m.attr("__version__") = rcp::VERSION_STRING;

    // ========================================================================
    // Progress
    // ========================================================================

    py::class_<rcp::ProgressSnapshot>(m, "ProgressSnapshot", "Consistent copy of the progress state")
        .def_readonly("percentage", &rcp::ProgressSnapshot::percentage)
        .def_readonly("stage", &rcp::ProgressSnapshot::stage)
        .def_readonly("agent", &rcp::ProgressSnapshot::agent)
        .def_readonly("activity", &rcp::ProgressSnapshot::activity)
        .def_property_readonly("elapsed_seconds", &rcp::ProgressSnapshot::elapsed_seconds)
        .def("to_dict", &snapshot_to_dict);

    py::class_<rcp::ProgressTracker>(m, "ProgressTracker", "Thread-safe report generation progress")
        .def(py::init<>())
        .def("update", &rcp::ProgressTracker::update,
             py::arg("percentage"), py::arg("stage"), py::arg("agent"), py::arg("activity"))
        .def("snapshot", &rcp::ProgressTracker::snapshot)
        .def("get_progress", [](const rcp::ProgressTracker& tracker) {
            return snapshot_to_dict(tracker.snapshot());
        })
        .def("get_elapsed_seconds", &rcp::ProgressTracker::elapsed_seconds)
        .def("reset", &rcp::ProgressTracker::reset);

    // ========================================================================
    // Storage
    // ========================================================================

    py::class_<rcp::ReportStore>(m, "ReportStore", "Atomic file storage for reports")
        .def(py::init<std::filesystem::path, std::string>(),
             py::arg("reports_dir"), py::arg("extension") = ".md")
        .def("save", [](const rcp::ReportStore& store, const std::string& name, const std::string& content) {
            return unwrap_result(store.save(name, content));
        }, py::arg("name"), py::arg("content"))
        .def("read", [](const rcp::ReportStore& store, const std::string& name) {
            return unwrap_result(store.read(name));
        }, py::arg("name"))
        .def("delete", [](const rcp::ReportStore& store, const std::string& name) {
            return unwrap_result(store.remove(name));
        }, py::arg("name"))
        .def("list", [](const rcp::ReportStore& store) {
            return unwrap_result(store.list());
        })
        .def("exists", &rcp::ReportStore::exists, py::arg("name"))
        .def("sanitize_in_place", [](const rcp::ReportStore& store, const std::string& name) {
            return unwrap_result(store.sanitize_in_place(name));
        }, py::arg("name"))
        .def_property_readonly("root", &rcp::ReportStore::root)
        // Names used by existing host scripts
        .def("save_report", [](const rcp::ReportStore& store, const std::string& name, const std::string& content) {
            return unwrap_result(store.save(name, content)).string();
        }, py::arg("filename"), py::arg("content"))
        .def("read_report", [](const rcp::ReportStore& store, const std::string& name) {
            return unwrap_result(store.read(name));
        }, py::arg("filename"))
        .def("delete_report", [](const rcp::ReportStore& store, const std::string& name) {
            return unwrap_result(store.remove(name));
        }, py::arg("filename"))
        .def("get_all_reports", [](const rcp::ReportStore& store) {
            return unwrap_result(store.list());
        });

    m.attr("ReportManager") = m.attr("ReportStore");

    m.def("list_reports", [](const std::filesystem::path& dir, const std::string& extension) {
        return unwrap_result(rcp::list_reports(dir, extension));
    }, py::arg("dir_path"), py::arg("extension") = ".md", "List report files in a directory");

    // ========================================================================
    // Text pipeline
    // ========================================================================

    m.def("sanitize", [](const std::string& text) {
        return rcp::pipeline::sanitize(text);
    }, py::arg("text"), "Remove terminal escape sequences");

    m.def("extract_metadata", [](const std::string& content) {
        return document_to_tuple(unwrap_result(rcp::pipeline::extract_frontmatter(content)));
    }, py::arg("content"), "Split a document with a mandatory metadata block into (metadata, body)");

    m.def("extract_metadata_permissive", [](const std::string& content) {
        return document_to_tuple(unwrap_result(rcp::pipeline::extract_permissive(content)));
    }, py::arg("content"), "Split a document whose metadata block is optional into (metadata, body)");

    const auto render = [](const std::string& markdown, const std::string& isolation, const bool superscript) {
        rcp::render::RenderOptions options;
        options.isolation = isolation_from(isolation);
        options.superscript = superscript;

        rcp::Result<std::string> html = rcp::Result<std::string>::failure(rcp::Error::internal_error("not run"));
        {
            py::gil_scoped_release release;
            html = rcp::pipeline::render(markdown, options);
        }
        return unwrap_result(std::move(html));
    };

    m.def("render", render, py::arg("markdown"), py::arg("isolation") = "thread", py::arg("superscript") = true,
          "Render markdown to HTML");
    m.def("process_markdown", render, py::arg("markdown"), py::arg("isolation") = "thread",
          py::arg("superscript") = true, "Render markdown to HTML");

    m.def("export_pdf", [](const std::string& body, const std::filesystem::path& destination,
                           const std::string& converter) {
        rcp::Config config;
        config.export_.converter = converter;

        rcp::Result<std::filesystem::path> path = rcp::Result<std::filesystem::path>::failure(
            rcp::Error::internal_error("not run"));
        {
            py::gil_scoped_release release;
            path = rcp::pipeline::export_pdf(body, destination, config);
        }
        return unwrap_result(std::move(path));
    }, py::arg("body"), py::arg("destination"), py::arg("converter") = "wkhtmltopdf",
    "Export markdown as PDF through an external converter");

    m.def("open_with_default_app", [](const std::filesystem::path& path) {
        unwrap_result(rcp::pipeline::open_with_default_app(path));
    }, py::arg("path"), "Open a file with the platform's default application");

    // ========================================================================
    // Report headers
    // ========================================================================

    m.def("format_report", [](const std::string& content, const std::string& title) {
        return rcp::format::format_report(content, title);
    }, py::arg("content"), py::arg("title"), "Prepend the styled report header");

    m.def("format_report_frontmatter", [](const std::string& content, const std::string& title) {
        return rcp::format::format_report_frontmatter(content, title);
    }, py::arg("content"), py::arg("title"), "Prepend a metadata block and heading");

    m.def("parse_report_metadata", [](const std::string& content) {
        const auto header = rcp::format::scrape_header_metadata(content);
        py::dict d;
        d["title"] = header.title;
        d["date"] = header.date;
        d["id"] = header.id;
        return d;
    }, py::arg("content"), "Read title, date and id from a styled report header");

    m.def("report_file_name", [](const std::string& topic) {
        return rcp::format::report_file_name(topic);
    }, py::arg("topic"), "File name for a new report on topic");

    m.def("set_log_level", [](const std::string& level) {
        unwrap_result(rcp::logging::set_level(level));
    }, py::arg("level"));
}
