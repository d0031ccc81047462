#include "recache/cache/bulk_cache.hpp"
#include "recache/cache/point_cache.hpp"

#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>

namespace py = pybind11;

namespace {

using recache::async::Context;
using recache::cache::BulkCache;
using recache::cache::CacheOptions;
using recache::cache::CacheStatistics;
using recache::cache::Duration;
using recache::cache::PointCache;

Context contextFor(std::optional<Duration> timeout) {
    if (timeout) {
        return Context{}.withTimeout(*timeout);
    }
    return Context{};
}

CacheOptions makeOptions(Duration refresh_interval, Duration keep_time,
                         std::string name) {
    CacheOptions options;
    options.refresh_interval = refresh_interval;
    options.keep_time = keep_time;
    options.name = std::move(name);
    return options;
}

/*
 * The wrappers own the Python callable and close the cache with the GIL
 * released, since the maintenance thread needs the GIL to finish a producer
 * call before it can be joined.
 */
class PyPointCache {
public:
    using Cache = PointCache<std::string, std::string>;

    PyPointCache(Duration refresh_interval, Duration keep_time,
                 py::function producer, std::string name)
        : producer_(std::move(producer)) {
        cache_ = std::make_unique<Cache>(
            makeOptions(refresh_interval, keep_time, std::move(name)),
            [this](const std::string& key,
                   const Context&) -> std::optional<std::string> {
                py::gil_scoped_acquire gil;
                py::object result = producer_(key);
                if (result.is_none()) {
                    return std::nullopt;
                }
                return result.cast<std::string>();
            });
    }

    ~PyPointCache() {
        py::gil_scoped_release release;
        cache_->close();
    }

    PyPointCache(const PyPointCache&) = delete;
    PyPointCache& operator=(const PyPointCache&) = delete;

    Cache& cache() { return *cache_; }

    std::optional<std::string> get(const std::string& key,
                                   std::optional<Duration> timeout) {
        return cache_->get(key, contextFor(timeout));
    }

private:
    py::function producer_;
    std::unique_ptr<Cache> cache_;
};

class PyBulkCache {
public:
    using Cache = BulkCache<std::string, std::string>;

    PyBulkCache(Duration refresh_interval, Duration keep_time,
                py::function producer, std::string name)
        : producer_(std::move(producer)) {
        cache_ = std::make_unique<Cache>(
            makeOptions(refresh_interval, keep_time, std::move(name)),
            [this](const Context&, const Cache::Setter& set) {
                py::gil_scoped_acquire gil;
                // A setter kept past its run raises instead of writing.
                auto live = std::make_shared<bool>(true);
                py::cpp_function setter(
                    [&set, live](const std::string& key, std::string value) {
                        if (!*live) {
                            throw recache::cache::CacheException(
                                "setter used after its producer run ended");
                        }
                        set(key, std::move(value));
                    });
                // Cleared on every exit path, exceptions included.
                struct RunGuard {
                    std::shared_ptr<bool> flag;
                    ~RunGuard() { *flag = false; }
                } guard{live};
                py::object result = producer_(setter);
                return result.is_none() || py::cast<bool>(result);
            });
    }

    ~PyBulkCache() {
        py::gil_scoped_release release;
        cache_->close();
    }

    PyBulkCache(const PyBulkCache&) = delete;
    PyBulkCache& operator=(const PyBulkCache&) = delete;

    Cache& cache() { return *cache_; }

    std::optional<std::string> get(const std::string& key,
                                   std::optional<Duration> timeout) {
        return cache_->get(key, contextFor(timeout));
    }

    bool waitReady(std::optional<Duration> timeout) {
        return cache_->waitReady(contextFor(timeout));
    }

private:
    py::function producer_;
    std::unique_ptr<Cache> cache_;
};

}  // namespace

PYBIND11_MODULE(recache_py, m) {
    m.doc() = "Refreshing in-process caches backed by Python producers";

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p)
                std::rethrow_exception(p);
        } catch (const recache::cache::CacheConfigException& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        } catch (const recache::cache::CacheException& e) {
            PyErr_SetString(PyExc_RuntimeError, e.what());
        }
    });

    py::class_<CacheStatistics>(m, "CacheStatistics")
        .def_readonly("hits", &CacheStatistics::hits)
        .def_readonly("misses", &CacheStatistics::misses)
        .def_readonly("loads", &CacheStatistics::loads)
        .def_readonly("load_failures", &CacheStatistics::load_failures)
        .def_readonly("refreshes", &CacheStatistics::refreshes)
        .def_readonly("refresh_failures", &CacheStatistics::refresh_failures)
        .def_readonly("evictions", &CacheStatistics::evictions)
        .def_readonly("size", &CacheStatistics::size);

    py::class_<PyPointCache>(m, "PointCache",
                             R"(A cache computing each key on first use.

Hot keys are recomputed in the background once they are older than
refresh_interval. Entries older than keep_time are dropped; a zero keep_time
keeps them forever.

Args:
    refresh_interval: Staleness window (timedelta or seconds)
    keep_time: Eviction age (timedelta or seconds)
    producer: Callable taking a key and returning a string, or None on failure
    name: Label used in log messages

Examples:
    >>> from recache_py import PointCache
    >>> with PointCache(3.0, 3600.0, lambda key: str(len(key))) as cache:
    ...     cache.get("abc")
    '3'
)")
        .def(py::init<Duration, Duration, py::function, std::string>(),
             py::arg("refresh_interval"), py::arg("keep_time"),
             py::arg("producer"), py::arg("name") = "default")
        .def("get", &PyPointCache::get, py::arg("key"),
             py::arg("timeout") = std::optional<Duration>(),
             py::call_guard<py::gil_scoped_release>())
        .def(
            "set",
            [](PyPointCache& self, const std::string& key, std::string value) {
                self.cache().set(key, std::move(value));
            },
            py::arg("key"), py::arg("value"))
        .def(
            "remove",
            [](PyPointCache& self, const std::string& key) {
                return self.cache().remove(key);
            },
            py::arg("key"))
        .def(
            "sweep", [](PyPointCache& self) { self.cache().sweep(); },
            py::call_guard<py::gil_scoped_release>())
        .def(
            "close", [](PyPointCache& self) { self.cache().close(); },
            py::call_guard<py::gil_scoped_release>())
        .def_property_readonly(
            "closed", [](PyPointCache& self) { return self.cache().closed(); })
        .def("statistics",
             [](PyPointCache& self) { return self.cache().statistics(); })
        .def("__contains__",
             [](PyPointCache& self, const std::string& key) {
                 return self.cache().contains(key);
             })
        .def("__len__", [](PyPointCache& self) { return self.cache().size(); })
        .def("__enter__", [](PyPointCache& self) -> PyPointCache& { return self; },
             py::return_value_policy::reference)
        .def(
            "__exit__",
            [](PyPointCache& self, py::object, py::object, py::object) {
                py::gil_scoped_release release;
                self.cache().close();
            });

    py::class_<PyBulkCache>(m, "BulkCache",
                            R"(A cache filled by one producer run on a fixed cadence.

Reads block until the first successful run. Runs merge into the existing
content; keys a run does not write keep their value until keep_time passes.

Args:
    refresh_interval: Time between producer runs (timedelta or seconds)
    keep_time: Eviction age (timedelta or seconds)
    producer: Callable taking a setter(key, value); returns False on failure
    name: Label used in log messages

Examples:
    >>> from recache_py import BulkCache
    >>> def fill(put):
    ...     for i in range(10):
    ...         put(str(i), str(i * i))
    >>> with BulkCache(4.0, 3600.0, fill) as cache:
    ...     cache.get("3")
    '9'
)")
        .def(py::init<Duration, Duration, py::function, std::string>(),
             py::arg("refresh_interval"), py::arg("keep_time"),
             py::arg("producer"), py::arg("name") = "default")
        .def("get", &PyBulkCache::get, py::arg("key"),
             py::arg("timeout") = std::optional<Duration>(),
             py::call_guard<py::gil_scoped_release>())
        .def("wait_ready", &PyBulkCache::waitReady,
             py::arg("timeout") = std::optional<Duration>(),
             py::call_guard<py::gil_scoped_release>())
        .def_property_readonly(
            "ready", [](PyBulkCache& self) { return self.cache().ready(); })
        .def(
            "evict_expired",
            [](PyBulkCache& self) { return self.cache().evictExpired(); },
            py::call_guard<py::gil_scoped_release>())
        .def(
            "close", [](PyBulkCache& self) { self.cache().close(); },
            py::call_guard<py::gil_scoped_release>())
        .def_property_readonly(
            "closed", [](PyBulkCache& self) { return self.cache().closed(); })
        .def("statistics",
             [](PyBulkCache& self) { return self.cache().statistics(); })
        .def("__len__", [](PyBulkCache& self) { return self.cache().size(); })
        .def("__enter__", [](PyBulkCache& self) -> PyBulkCache& { return self; },
             py::return_value_policy::reference)
        .def(
            "__exit__",
            [](PyBulkCache& self, py::object, py::object, py::object) {
                py::gil_scoped_release release;
                self.cache().close();
            });
}
