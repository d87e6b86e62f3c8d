#include "nrt_predict/config/configuration.hpp"
#include "nrt_predict/core/diagnostics.hpp"
#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/core/events.hpp"
#include "nrt_predict/core/utils.hpp"
#include "nrt_predict/io/gdal_backend.hpp"
#include "nrt_predict/io/object_store.hpp"
#include "nrt_predict/model/model_locator.hpp"
#include "nrt_predict/model/model_registry.hpp"
#include "nrt_predict/pipeline/pipeline.hpp"

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace config = nrt_predict::config;
namespace core = nrt_predict::core;
namespace io = nrt_predict::io;
namespace model = nrt_predict::model;
namespace pipeline = nrt_predict::pipeline;

static_assert(std::atomic<bool>::is_always_lock_free, "stop flag must be lock free");

std::atomic<bool> g_stop{false};

void HandleSignal(int) { g_stop.store(true); }

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"NRT prediction runner"};

  std::string url;
  std::string config_path = config::kDefaultConfigFile;
  std::string events_path;
  std::string product;
  std::string tmpdir;
  bool quiet = false;
  bool print_config = false;
  bool dry_run = false;

  app.add_option("url", url, "Observation package URL or path");
  app.add_option("-c,--config", config_path, "Path to the YAML configuration")
      ->capture_default_str();
  app.add_option("--events", events_path, "Also write run events to this file");
  app.add_flag("--quiet", quiet, "Only print errors");
  app.add_option("--product", product, "Product of the package to load (NBAR, NBART)");
  app.add_option("--tmpdir", tmpdir, "Directory for scratch files");
  app.add_flag("--print-config", print_config,
               "Print the effective configuration and exit");
  app.add_flag("--dry-run", dry_run, "Check the configuration and inputs, then exit");

  CLI11_PARSE(app, argc, argv);

  config::Config cfg;
  const config::ConfigFileStatus file_status =
      config::load_file_layer(config_path, cfg);

  config::CliOverrides overrides;
  if (app.count("url") > 0) overrides.url = url;
  if (app.count("--product") > 0) overrides.product = product;
  if (app.count("--tmpdir") > 0) overrides.tmpdir = tmpdir;
  if (quiet) overrides.quiet = true;
  config::apply_overrides(overrides, cfg);

  if (print_config) {
    std::cout << cfg.to_yaml() << std::endl;
    return 0;
  }

  core::Diagnostics diag(std::cerr, cfg.quiet);
  if (file_status.loaded) {
    diag.info("", file_status.message);
  } else {
    diag.warning(file_status.message);
    diag.warning("Continuing without configuration file...");
  }

  try {
    diag.section("Checking configuration");
    cfg.validate();
    if (cfg.url.empty()) {
      throw nrt_predict::ValidationError("no observation url given");
    }

    io::GdalRasterBackend backend(cfg.gdalconfig);
    for (const auto &[key, value] : cfg.gdalconfig.options) {
      diag.info("", "GDAL option " + key + " = " + value);
    }

    const pipeline::PreflightReport report = pipeline::preflight(cfg, backend);
    if (!report.ok()) {
      for (const auto &problem : report.problems) {
        diag.error(problem);
      }
      return 1;
    }

    if (dry_run) {
      diag.info("", "Configuration is valid, " + std::to_string(cfg.models.size()) +
                        " model(s) ready");
      return 0;
    }

    std::ofstream events_file;
    std::unique_ptr<core::TeeBuf> tee;
    std::ostream events_out(std::cout.rdbuf());
    if (!events_path.empty()) {
      events_file.open(events_path, std::ios::out | std::ios::trunc);
      if (!events_file.is_open()) {
        diag.error("cannot open events file: " + events_path);
        return 1;
      }
      tee = std::make_unique<core::TeeBuf>(std::cout.rdbuf(), events_file.rdbuf());
      events_out.rdbuf(tee.get());
    }

    core::EventEmitter events(core::get_run_id(), events_out);
    std::vector<std::string> model_names;
    for (const auto &m : cfg.models) model_names.push_back(m.name);
    io::GdalObjectStore store(model::remote_buckets(model_names));
    const model::ModelRegistry registry = model::default_registry();

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    pipeline::PipelineRunner runner(
        cfg, pipeline::PipelineServices{backend, store, registry, events, diag, &g_stop});
    const pipeline::RunResult result = runner.run();
    events_out.flush();
    return pipeline::exit_code_for(result.status);
  } catch (const std::exception &e) {
    diag.error(e.what());
    return 1;
  }
}
