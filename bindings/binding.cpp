#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "Analysis.h"
#include "Collector.h"
#include "CompiledExpression.h"
#include "Course.h"
#include "CutoffEvaluator.h"
#include "SectionSpec.h"
#include "SimulationConfig.h"
#include "Simulator.h"


namespace py = pybind11;
using namespace trailsim;


static const char* status_name(const RunnerStatus status) {
     switch (status) {
     case RunnerStatus::NOT_STARTED: return "not_started";
     case RunnerStatus::ACTIVE: return "active";
     case RunnerStatus::FINISHED: return "finished";
     case RunnerStatus::DNF: return "dnf";
     }
     throw py::value_error("Unknown runner status");
}


namespace trailsim {
     struct PySimulator {
          std::unique_ptr<Simulator> core;

          PySimulator(const Course& course, const SimulationConfig& config,
                      const std::shared_ptr<PaceModel>& paceModel) {
               if (paceModel)
                    core = std::make_unique<Simulator>(course, config, *paceModel);
               else
                    core = std::make_unique<Simulator>(course, config);
          }

          void run(const std::vector<std::shared_ptr<DataCollector>>& collectors) const {
               DataCollectorGroup group(collectors);
               py::gil_scoped_release release;
               core->run(group);
          }
     };
}


PYBIND11_MODULE(_trailsim, m) {
     m.doc() = "Trail-race congestion simulator";

     // Course
     py::class_<CourseSample>(m, "CourseSample")
          .def(py::init([](double distance, double elevation, double latitude, double longitude) {
                    CourseSample s{distance, elevation};
                    s.latitude = latitude;
                    s.longitude = longitude;
                    return s;
               }),
               py::arg("distance"),
               py::arg("elevation"),
               py::arg("latitude") = 0.0,
               py::arg("longitude") = 0.0
          )
          .def_readonly("distance", &CourseSample::distance)
          .def_readonly("elevation", &CourseSample::elevation)
          .def_readonly("gradient", &CourseSample::gradient)
          .def_readonly("latitude", &CourseSample::latitude)
          .def_readonly("longitude", &CourseSample::longitude);

     py::class_<GeoPoint>(m, "GeoPoint")
          .def_readonly("latitude", &GeoPoint::latitude)
          .def_readonly("longitude", &GeoPoint::longitude);

     py::class_<Course, std::shared_ptr<Course>>(m, "Course")
          .def(py::init<std::vector<CourseSample>>(), py::arg("samples"))
          .def_static("from_csv", &Course::fromCsv, py::arg("path"))
          .def_property_readonly("length", &Course::length)
          .def_property_readonly("samples", &Course::samples, py::return_value_policy::reference_internal)
          .def("nearest_index", &Course::nearestIndex, py::arg("distance"))
          .def("locate", &Course::locate, py::arg("distance"));

     // Single-track sections
     py::class_<CapacityRange>(m, "CapacityRange")
          .def_readonly("start_m", &CapacityRange::startM)
          .def_readonly("end_m", &CapacityRange::endM)
          .def_readonly("capacity", &CapacityRange::capacity);

     py::class_<SectionSpec>(m, "SectionSpec")
          .def_static("explicit_range", &SectionSpec::explicitRange,
                      py::arg("start_km"), py::arg("end_km"), py::arg("capacity"),
                      "Capacity on [start_km, end_km].")
          .def_static("percentage", &SectionSpec::percentage,
                      py::arg("start_pct"), py::arg("end_pct"), py::arg("capacity"),
                      "Capacity on a percentage range of the course.")
          .def_static("random", &SectionSpec::random,
                      py::arg("total_pct"), py::arg("capacity"), py::arg("chunk_m") = 100.0,
                      "Random chunks covering total_pct percent of the course.")
          .def_property_readonly("kind", [](const SectionSpec& s) {
               switch (s.kind) {
               case SectionSpec::Kind::Explicit: return std::string("explicit");
               case SectionSpec::Kind::Percentage: return std::string("percentage");
               case SectionSpec::Kind::Random: return std::string("random");
               }
               throw py::value_error("Unknown section kind");
          });

     m.def("resolve_sections", [](const std::vector<SectionSpec>& specs, const double courseLength, uint64_t seed) {
                RngEngine rng(seed);
                return resolveSections(specs, courseLength, rng);
           },
           py::arg("specs"),
           py::arg("course_length"),
           py::arg("seed"));

     // Cutoffs & waves
     py::class_<Cutoff>(m, "Cutoff")
          .def(py::init<double, double>(), py::arg("distance_m"), py::arg("time_sec"))
          .def_static("from_km_hours", &Cutoff::fromKmHours, py::arg("distance_km"), py::arg("time_hours"))
          .def_readonly("distance_m", &Cutoff::distanceM)
          .def_readonly("time_sec", &Cutoff::timeSec);

     py::class_<WaveStart>(m, "WaveStart")
          .def(py::init([](int groups, double intervalMinutes) { return WaveStart{groups, intervalMinutes}; }),
               py::arg("groups") = 1,
               py::arg("interval_minutes") = 0.0)
          .def_readwrite("groups", &WaveStart::groups)
          .def_readwrite("interval_minutes", &WaveStart::intervalMinutes)
          .def("is_mass_start", &WaveStart::isMassStart);

     // Config
     py::class_<SimulationConfig>(m, "SimulationConfig")
          .def(py::init<>())
          .def_readwrite("runners", &SimulationConfig::runners)
          .def_readwrite("avg_pace", &SimulationConfig::avgPaceMinPerKm)
          .def_readwrite("std_dev", &SimulationConfig::stdDevPaceMinPerKm)
          .def_readwrite("time_limit_hours", &SimulationConfig::timeLimitHours)
          .def_readwrite("step_sec", &SimulationConfig::stepSec)
          .def_readwrite("cell_width_m", &SimulationConfig::cellWidthM)
          .def_readwrite("waves", &SimulationConfig::waves)
          .def_readwrite("cutoffs", &SimulationConfig::cutoffs)
          .def_readwrite("sections", &SimulationConfig::sections)
          .def_readwrite("default_capacity", &SimulationConfig::defaultCapacity)
          .def_readwrite("seed", &SimulationConfig::seed)
          .def("validate", &SimulationConfig::validate);

     // Pace models
     py::class_<PaceModel, std::shared_ptr<PaceModel>>(m, "PaceModel");

     py::class_<GradientPaceModel, PaceModel, std::shared_ptr<GradientPaceModel>>(m, "GradientPaceModel")
          .def(py::init<>());

     py::class_<ExpressionPaceModel, PaceModel, std::shared_ptr<ExpressionPaceModel>>(m, "ExpressionPaceModel")
          .def(py::init<std::string>(),
               py::arg("expr"),
               "Pace factor from an expression over gradient, elevation and distance.")
          .def_property_readonly("expr", &ExpressionPaceModel::expr);

     // DataCollector base + subclasses
     py::class_<DataCollector, std::shared_ptr<DataCollector>>(m, "DataCollector");

     py::class_<TrajectoryRecorder, DataCollector, std::shared_ptr<TrajectoryRecorder>>(m, "TrajectoryRecorder")
          .def(py::init<size_t>(), py::arg("stride") = 1)
          .def("time_sec", [](const TrajectoryRecorder& t) { return t.table().timeSec; })
          .def("positions", [](const TrajectoryRecorder& t) { return t.table().positions; })
          .def("write_csv", &TrajectoryRecorder::writeCsv, py::arg("path"));

     py::class_<StatusCounts>(m, "StatusCounts")
          .def_readonly("not_started", &StatusCounts::notStarted)
          .def_readonly("active", &StatusCounts::active)
          .def_readonly("finished", &StatusCounts::finished)
          .def_readonly("dnf", &StatusCounts::dnf);

     py::class_<RaceStatusCollector, DataCollector, std::shared_ptr<RaceStatusCollector>>(m, "RaceStatusCollector")
          .def(py::init<>())
          .def("counts", &RaceStatusCollector::counts, py::return_value_policy::reference_internal)
          .def("finish_times", &RaceStatusCollector::finishTimes, py::return_value_policy::reference_internal)
          .def("dnf_times", &RaceStatusCollector::dnfTimes, py::return_value_policy::reference_internal)
          .def("final_statuses", [](const RaceStatusCollector& c) {
               std::vector<std::string> names;
               for (const auto status : c.finalStatuses()) names.emplace_back(status_name(status));
               return names;
          });

     // Simulator
     py::class_<PySimulator, std::shared_ptr<PySimulator>>(m, "Simulator")
          .def(py::init<Course, SimulationConfig, std::shared_ptr<PaceModel>>(),
               py::arg("course"),
               py::arg("config"),
               py::arg("pace_model") = nullptr)
          .def("run", &PySimulator::run, py::arg("collectors"))
          .def("sections", [](const PySimulator& s) { return s.core->sections(); })
          .def("paces", [](const PySimulator& s) { return s.core->population().paces(); })
          .def("start_offsets", [](const PySimulator& s) { return s.core->population().startOffsets(); })
          .def("cell_capacities", [](const PySimulator& s) {
               std::vector<int> caps;
               for (const auto& cell : s.core->engine().cells()) caps.push_back(cell.capacity);
               return caps;
          });

     py::class_<RunSummary>(m, "RunSummary")
          .def_readonly("finished", &RunSummary::finished)
          .def_readonly("dnf", &RunSummary::dnf)
          .def_readonly("unfinished", &RunSummary::unfinished)
          .def_readonly("median_finish_sec", &RunSummary::medianFinishSec)
          .def_readonly("last_finish_sec", &RunSummary::lastFinishSec);

     m.def("run_sweep", [](const Course& course, const std::vector<SimulationConfig>& jobs, int maxWorkers,
                           const std::shared_ptr<PaceModel>& paceModel) {
                py::gil_scoped_release release;
                return paceModel ? runSweep(course, jobs, maxWorkers, *paceModel) : runSweep(course, jobs, maxWorkers);
           },
           py::arg("course"),
           py::arg("jobs"),
           py::arg("max_workers") = 1,
           py::arg("pace_model") = nullptr);

     // Analysis
     py::class_<Snapshot>(m, "Snapshot")
          .def_readonly("time_sec", &Snapshot::timeSec)
          .def_readonly("finished", &Snapshot::finished)
          .def_readonly("dnf", &Snapshot::dnf)
          .def_readonly("active", &Snapshot::active)
          .def_readonly("mean_active_position_m", &Snapshot::meanActivePositionM)
          .def_readonly("bin_width_m", &Snapshot::binWidthM)
          .def_readonly("histogram", &Snapshot::histogram);

     m.def("passage_times", [](const TrajectoryRecorder& rec, const double distanceM) {
                return passageTimes(rec.table(), distanceM);
           },
           py::arg("trajectory"), py::arg("distance_m"));

     m.def("peak_passage_time", &peakPassageTime, py::arg("times"), py::arg("bins") = 50);

     m.def("snapshot", [](const TrajectoryRecorder& rec, const double courseLength, const double timeSec,
                          const int bins, const std::vector<double>& dnfTimes) {
                return snapshot(rec.table(), courseLength, timeSec, bins, dnfTimes);
           },
           py::arg("trajectory"),
           py::arg("course_length"),
           py::arg("time_sec"),
           py::arg("bins") = 80,
           py::arg("dnf_times") = std::vector<double>{});

     m.def("geo_positions", [](const TrajectoryRecorder& rec, const Course& course, const size_t row) {
                std::vector<std::pair<double, double>> latLon;
                for (const auto& p : geoPositions(rec.table(), course, row)) latLon.emplace_back(p.latitude, p.longitude);
                return latLon;
           },
           py::arg("trajectory"), py::arg("course"), py::arg("row"));
}
