#include "factory.hpp"

#include <string>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/fixture/fixture_loader.hpp"
#include "internal/observability/logging.hpp"

namespace txfeed::factory {

namespace {

std::filesystem::path ResolvePath(const std::filesystem::path& base_dir, const std::string& path) {
  std::filesystem::path resolved(path);
  if (resolved.is_relative()) {
    resolved = base_dir / resolved;
  }
  return resolved.lexically_normal();
}

} // namespace

Application Build(const txfeed::runtime::config::RuntimeConfig& config, const std::filesystem::path& base_dir) {
  config::ValidateConfig(config);

  Application app;
  app.default_limit = config::EffectiveDefaultLimit(config);

  // ------------------------------------------------------------------
  // Sources (declaration order = stream index)
  // ------------------------------------------------------------------
  app.streams.reserve(config.sources_size());
  for (const auto& source : config.sources()) {
    const auto path = ResolvePath(base_dir, source.fixture_path());
    app.streams.push_back(fixture::LoadStream(source.name(), path.string(), source.page_size()));
  }

  // ------------------------------------------------------------------
  // Merger
  // ------------------------------------------------------------------
  app.merger = std::make_unique<merge::StreamMerger>(app.streams);

  TXFEED_LOG_INFO("application built", {observability::IntField("sources", static_cast<std::int64_t>(app.streams.size())),
                                        observability::IntField("default_limit", app.default_limit)});
  return app;
}

} // namespace txfeed::factory
