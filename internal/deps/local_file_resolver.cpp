#include "internal/deps/local_file_resolver.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace runtrack::deps {

using runtrack::observability::StringField;

void LocalFileResolver::Resolve(const std::vector<std::string>& dependencies, const ResolutionContext& ctx) {
  for (const auto& dep : dependencies) {
    std::filesystem::path source(dep);
    if (source.is_relative()) {
      source = ctx.opdef.SourceDir() / source;
    }
    source = source.lexically_normal();

    if (!std::filesystem::exists(source)) {
      throw util::DependencyError("could not resolve '" + dep + "': " + source.string() + " does not exist");
    }

    auto name = source.filename();
    if (name.empty()) {
      name = source.parent_path().filename();
    }
    const auto link = ctx.target_dir / name;
    if (std::filesystem::exists(std::filesystem::symlink_status(link))) {
      throw util::DependencyError("could not resolve '" + dep + "': " + link.string() + " already exists");
    }

    std::error_code ec;
    std::filesystem::create_symlink(std::filesystem::absolute(source), link, ec);
    if (ec) {
      throw util::DependencyError("could not link '" + dep + "' into " + ctx.target_dir.string() + ": " + ec.message());
    }

    RUNTRACK_LOG_DEBUG("resolved dependency", {StringField("name", dep), StringField("source", source.string())});
  }
}

} // namespace runtrack::deps
