#include "nrt_predict/pipeline/pipeline.hpp"
#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/core/utils.hpp"
#include "nrt_predict/geometry/footprint.hpp"
#include "nrt_predict/model/model_locator.hpp"
#include "nrt_predict/model/model_resolver.hpp"

#include <filesystem>
#include <set>
#include <sstream>

namespace nrt_predict::pipeline {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char* kObservationDriver = "GTiff";
constexpr double kObservationNodata = 0.0;

std::string fixed4(double fraction) {
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss.precision(4);
    ss << fraction;
    return ss.str();
}

} // namespace

std::string run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::IntegrityFailure: return "integrity_failure";
        case RunStatus::ModelFailed: return "model_failed";
        case RunStatus::Interrupted: return "interrupted";
        case RunStatus::Failed: return "failed";
        default: return "unknown";
    }
}

int exit_code_for(RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return 0;
        case RunStatus::Interrupted: return 130;
        default: return 1;
    }
}

PreflightReport preflight(const config::Config& cfg, io::RasterBackend& backend) {
    PreflightReport report;
    std::set<std::string> produced;
    std::set<std::string> checked;

    for (const auto& m : cfg.models) {
        if (!backend.has_driver(m.driver)) {
            report.problems.push_back("'driver' for model '" + m.name + "' is not available: " +
                                      m.driver + " (available drivers: " +
                                      core::join(backend.driver_names(), ", ") + ")");
        }
        for (const auto& ip : m.inputs) {
            if (produced.count(ip.filename) > 0 || !checked.insert(ip.filename).second) {
                continue;
            }
            std::string err;
            if (!backend.can_open(ip.filename, &err)) {
                report.problems.push_back("input file error: " + err);
            }
        }
        produced.insert(m.output);
    }
    return report;
}

PipelineRunner::PipelineRunner(const config::Config& cfg, PipelineServices services)
    : cfg_(cfg), svc_(services) {}

void PipelineRunner::begin(Stage stage, const json& extra) {
    check_stop();
    stage_ = stage;
    svc_.events.stage_start(stage, extra);
}

void PipelineRunner::end(const std::string& status, const json& extra) {
    svc_.events.stage_end(stage_, status, extra);
}

void PipelineRunner::check_stop() {
    if (svc_.stop && svc_.stop->load()) {
        svc_.events.stop_requested(stage_);
        throw StopRequested();
    }
}

void PipelineRunner::warn(const std::string& message, const json& extra) {
    svc_.diag.warning(message);
    svc_.events.warning(message, extra);
}

std::string PipelineRunner::resolve_locator() {
    const std::string& url = cfg_.url;
    switch (observation::check_url(url)) {
        case observation::UrlCheck::Valid:
            if (!cfg_.urlprefix.empty()) {
                return cfg_.urlprefix + "/" + url;
            }
            return url;
        case observation::UrlCheck::MaybeLocalFile: {
            const std::string path = observation::local_path(url);
            std::error_code ec;
            if (!path.empty() && fs::exists(path, ec)) {
                warn("Observation data url seems to be a local file, continuing anyway...",
                     {{"url", url}});
                return path;
            }
            throw UrlFormatError(url);
        }
        case observation::UrlCheck::Invalid:
        default:
            throw UrlFormatError(url);
    }
}

void PipelineRunner::resolve_observation() {
    begin(Stage::RESOLVE_OBSERVATION, {{"url", cfg_.url}});
    svc_.diag.section("Retrieving NRT observation details");

    const std::string locator = resolve_locator();

    observation::ObservationOptions opts;
    opts.product = cfg_.product;
    opts.scale = cfg_.obsscale;
    obs_ = observation::resolve_observation(locator, opts, svc_.backend);

    if (obs_.footprint_via_http) {
        svc_.diag.info("", "Opening " + obs_.root + " using GDAL failed, trying alternative...");
    }
    if (!obs_.footprint_published) {
        std::string msg = "No published footprint for '" + obs_.package + "'";
        if (!obs_.footprint_error.empty()) {
            msg += " (" + obs_.footprint_error + ")";
        }
        warn(msg + ", using the grid outline", {{"reason", obs_.footprint_error}});
    }

    auto& d = svc_.diag;
    d.info("", "Package:   " + obs_.package);
    d.info("", "Thumbnail: " + observation::thumbnail_url(obs_.root, cfg_.product));
    d.info("", "Location:  " + observation::map_url(obs_.root));
    d.info("", "Pixels:    " + std::to_string(obs_.grid.height) + " x " +
                   std::to_string(obs_.grid.width));
    d.info("", "Clear %:   " + fixed4(obs_.clear_fraction));
    d.info("", "Obs. Date: " + observation::format_time(obs_.acquired));
    d.info("", "Obs. WKT:  " + geometry::truncate_wkt(obs_.footprint_wkt));

    d.info("", "Creating " + cfg_.obstmp);
    svc_.backend.write_raster(cfg_.obstmp, kObservationDriver, obs_.reflectance, obs_.grid,
                              kObservationNodata);

    end("ok", {{"package", obs_.package},
               {"obsdate", observation::format_time(obs_.acquired)},
               {"width", obs_.grid.width},
               {"height", obs_.grid.height},
               {"clear_fraction", obs_.clear_fraction},
               {"nodata_fraction", obs_.nodata_fraction},
               {"footprint_published", obs_.footprint_published}});
}

void PipelineRunner::build_footprint() {
    begin(Stage::BUILD_FOOTPRINT);
    svc_.diag.info("", "Determining observation shape");

    const io::RasterInfo info = svc_.backend.open_info(cfg_.obstmp);
    const geometry::Polygon poly =
        geometry::footprint_from_geotransform(info.grid.transform, info.grid.width,
                                              info.grid.height);
    svc_.diag.info("", "wkt: " + poly.to_wkt());
    svc_.backend.write_cutline(cfg_.clipshpfn, poly, info.grid.projection);

    end("ok", {{"cutline", cfg_.clipshpfn}, {"wkt", geometry::truncate_wkt(poly.to_wkt())}});
}

void PipelineRunner::build_alignment_cache() {
    begin(Stage::BUILD_ALIGNMENT_CACHE);
    svc_.diag.section("Preparing ancillary data");

    const auto sources = alignment::unique_sources(cfg_.models);
    svc_.diag.info("", "Inputs: " + core::join(sources, ", "));

    alignment::AlignmentOptions opts;
    opts.cutline = cfg_.clipshpfn;
    opts.tmpdir = cfg_.tmpdir;
    opts.nocleanup = cfg_.nocleanup;
    cache_ = std::make_unique<alignment::AlignmentCache>(svc_.backend, obs_.grid, opts);

    svc_.diag.section("Warping and clipping ancillary data");
    for (const auto& id : sources) {
        check_stop();
        svc_.diag.info("", "Clipping and warping input '" + id + "'");
        const auto& aligned = cache_->align(id);
        if (aligned.exceeds_nodata_limit) {
            warn("clipped input '" + id + "' has more than 90% no data",
                 {{"source", id}, {"nodata_fraction", aligned.nodata_fraction}});
        }
    }

    end("ok", {{"sources", sources}, {"alignments", cache_->alignment_count()}});
}

void PipelineRunner::run_model(const config::ModelConfig& m) {
    model_ = m.name;
    svc_.diag.section("Model: " + m.name);

    begin(Stage::RESOLVE_MODEL, {{"model", m.name}});
    const model::ModelLocator locator = model::parse_model_locator(m.name);
    svc_.diag.info("", "Loading model from " + model::describe_locator(locator));
    model::ModelResolver resolver(svc_.registry, svc_.store);
    model::ResolvedModel resolved = resolver.resolve(locator, m.params);
    if (resolved.checksum) {
        svc_.diag.info("", "Checksum matches: " + *resolved.checksum);
    }

    model::ModelContext ctx;
    ctx.footprint_wkt = obs_.footprint_wkt;
    ctx.acquired = obs_.acquired;
    ctx.grid = obs_.grid;
    ctx.driver = m.driver;
    ctx.writer = &svc_.backend;
    resolved.model->set_context(ctx);
    end("ok", {{"model", m.name}, {"source", resolved.source}});

    begin(Stage::ASSEMBLE_INPUTS, {{"model", m.name}});
    std::vector<Raster> inputs;
    inputs.reserve(m.inputs.size() + 1);
    for (const auto& ip : m.inputs) {
        if (!cache_->contains(ip.filename)) {
            // Output of an earlier model
            svc_.diag.info("", "Clipping and warping input '" + ip.filename + "'");
            const auto& aligned = cache_->align(ip.filename);
            if (aligned.exceeds_nodata_limit) {
                warn("clipped input '" + ip.filename + "' has more than 90% no data",
                     {{"source", ip.filename}, {"nodata_fraction", aligned.nodata_fraction}});
            }
        }
        inputs.push_back(cache_->copy(ip.filename));
    }
    inputs.push_back(obs_.reflectance);
    end("ok", {{"model", m.name}, {"inputs", inputs.size()}});

    begin(Stage::INVOKE, {{"model", m.name}, {"output", m.output}});
    resolved.model->predict_and_save(inputs, m.output);
    end("ok", {{"model", m.name}});

    begin(Stage::PERSIST, {{"model", m.name}, {"output", m.output}});
    const bool written = svc_.backend.can_open(m.output);
    if (!written) {
        svc_.diag.info("", "Model '" + m.name + "' wrote no raster to '" + m.output + "'");
    }
    end("ok", {{"model", m.name}, {"output", m.output}, {"written", written}});
    model_.clear();
}

RunResult PipelineRunner::run() {
    RunResult result;
    svc_.events.run_start({{"url", cfg_.url},
                           {"product", cfg_.product},
                           {"models", cfg_.models.size()},
                           {"tmpdir", cfg_.tmpdir}});

    try {
        resolve_observation();
        build_footprint();
        build_alignment_cache();
        for (const auto& m : cfg_.models) {
            check_stop();
            run_model(m);
            result.completed_models.push_back(m.name);
        }
        begin(Stage::DONE);
        end("ok");
        result.status = RunStatus::Completed;
    } catch (const StopRequested&) {
        result.status = RunStatus::Interrupted;
        result.message = "Processing interrupted, exiting...";
    } catch (const IntegrityError& e) {
        result.status = RunStatus::IntegrityFailure;
        result.message = "Model has an incorrect SHA256 checksum, exiting...";
        svc_.diag.info("", "Expected SHA256 checksum: " + e.expected());
        svc_.diag.info("", "Actual SHA256 checksum: " + e.actual());
    } catch (const std::exception& e) {
        if (stage_ == Stage::INVOKE || stage_ == Stage::PERSIST) {
            result.status = RunStatus::ModelFailed;
            result.message = "Error in model '" + model_ + "': " + e.what();
        } else {
            result.status = RunStatus::Failed;
            result.message = e.what();
        }
    }

    if (!result.ok()) {
        result.failed_stage = stage_;
        result.failed_model = model_;
        if (result.status != RunStatus::Interrupted) {
            end("error", {{"error", result.message}});
            svc_.events.error(result.message, {{"stage_name", stage_to_string(stage_)},
                                               {"model", model_}});
        }
        svc_.diag.error(result.message);
    }

    svc_.events.run_end(result.ok(), run_status_to_string(result.status),
                        {{"completed_models", result.completed_models}});
    return result;
}

} // namespace nrt_predict::pipeline
