#pragma once

#include "nrt_predict/alignment/alignment_cache.hpp"
#include "nrt_predict/config/configuration.hpp"
#include "nrt_predict/core/diagnostics.hpp"
#include "nrt_predict/core/events.hpp"
#include "nrt_predict/core/types.hpp"
#include "nrt_predict/io/object_store.hpp"
#include "nrt_predict/io/raster_backend.hpp"
#include "nrt_predict/model/model_registry.hpp"
#include "nrt_predict/observation/observation.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nrt_predict::pipeline {

enum class RunStatus {
    Completed,
    IntegrityFailure,
    ModelFailed,
    Interrupted,
    Failed
};

std::string run_status_to_string(RunStatus status);

// 0 on completion, 130 when interrupted, 1 otherwise
int exit_code_for(RunStatus status);

struct RunResult {
    RunStatus status = RunStatus::Failed;
    std::optional<Stage> failed_stage;
    std::string failed_model;
    std::string message;
    std::vector<std::string> completed_models;

    bool ok() const { return status == RunStatus::Completed; }
};

struct PreflightReport {
    std::vector<std::string> problems;

    bool ok() const { return problems.empty(); }
};

// Output drivers exist and every declared input that is not produced by an
// earlier model can be opened. All problems are collected.
PreflightReport preflight(const config::Config& cfg, io::RasterBackend& backend);

// Collaborators of a run, all owned by the caller
struct PipelineServices {
    io::RasterBackend& backend;
    io::ObjectStore& store;
    const model::ModelRegistry& registry;
    core::EventEmitter& events;
    core::Diagnostics& diag;
    const std::atomic<bool>* stop = nullptr;
};

/**
 * Runs the stages once:
 *   RESOLVE_OBSERVATION -> BUILD_FOOTPRINT -> BUILD_ALIGNMENT_CACHE
 *   -> per model: RESOLVE_MODEL -> ASSEMBLE_INPUTS -> INVOKE -> PERSIST
 *   -> DONE
 * The first integrity or invocation failure ends the run; later models are
 * not attempted. The stop flag is polled between stages, sources and models.
 */
class PipelineRunner {
public:
    PipelineRunner(const config::Config& cfg, PipelineServices services);

    RunResult run();

private:
    std::string resolve_locator();
    void resolve_observation();
    void build_footprint();
    void build_alignment_cache();
    void run_model(const config::ModelConfig& m);

    void begin(Stage stage, const nlohmann::json& extra = nlohmann::json::object());
    void end(const std::string& status, const nlohmann::json& extra = nlohmann::json::object());
    void check_stop();
    void warn(const std::string& message, const nlohmann::json& extra = nlohmann::json::object());

    const config::Config& cfg_;
    PipelineServices svc_;
    Stage stage_ = Stage::RESOLVE_OBSERVATION;
    std::string model_;
    observation::ObservationPackage obs_;
    std::unique_ptr<alignment::AlignmentCache> cache_;
};

} // namespace nrt_predict::pipeline
