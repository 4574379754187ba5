#include "internal/run/run.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <type_traits>
#include <variant>

#include "internal/storage/path_utils.hpp"

namespace runtrack::run {

namespace {

constexpr char kMetaDir[]  = ".runtrack";
constexpr char kAttrsDir[] = "attrs";

void EmitScalar(YAML::Emitter& out, const model::FlagValue& value) {
  std::visit(
      [&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          out << YAML::Null;
        } else {
          out << v;
        }
      },
      value);
}

void Emit(YAML::Emitter& out, const AttrValue& value) {
  std::visit(
      [&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::int64_t>) {
          out << v;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
          out << YAML::BeginSeq;
          for (const auto& item : v) out << item;
          out << YAML::EndSeq;
        } else if constexpr (std::is_same_v<T, model::FlagMap>) {
          out << YAML::BeginMap;
          for (const auto& [name, flag] : v) {
            out << YAML::Key << name << YAML::Value;
            EmitScalar(out, flag);
          }
          out << YAML::EndMap;
        } else {
          out << YAML::BeginMap;
          for (const auto& [name, env_value] : v) out << YAML::Key << name << YAML::Value << env_value;
          out << YAML::EndMap;
        }
      },
      value);
}

} // namespace

Run::Run(std::string id, std::filesystem::path path) : id_(std::move(id)), path_(std::move(path)) {
}

Run Run::FromPath(const std::filesystem::path& path) {
  auto abs_path = std::filesystem::absolute(path).lexically_normal();
  if (!abs_path.has_filename()) {
    abs_path = abs_path.parent_path();
  }
  return Run(abs_path.filename().string(), abs_path);
}

void Run::InitSkeleton() {
  std::filesystem::create_directories(path_);
  if (!std::filesystem::create_directory(path_ / kMetaDir)) {
    throw std::runtime_error("run " + id_ + " is already initialized at " + path_.string());
  }
  std::filesystem::create_directory(path_ / kMetaDir / kAttrsDir);
}

std::filesystem::path Run::MetaPath(const std::string& name) const {
  return path_ / kMetaDir / name;
}

std::filesystem::path Run::AttrPath(const std::string& key) const {
  storage::ValidatePathComponent(key, "attribute name");
  return path_ / kMetaDir / kAttrsDir / key;
}

void Run::WriteAttr(const std::string& key, const AttrValue& value) const {
  YAML::Emitter out;
  Emit(out, value);
  if (!out.good()) {
    throw std::runtime_error("cannot encode attr '" + key + "': " + out.GetLastError());
  }

  const auto final_path = AttrPath(key);
  const auto tmp_path   = final_path.string() + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    file << out.c_str() << '\n';
    file.close();
    if (!file) {
      throw std::runtime_error("cannot write attr '" + key + "' of run " + id_);
    }
  }

  std::filesystem::rename(tmp_path, final_path);
}

bool Run::HasAttr(const std::string& key) const {
  return std::filesystem::exists(AttrPath(key));
}

std::optional<YAML::Node> Run::GetAttr(const std::string& key) const {
  const auto path = AttrPath(key);
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }
  try {
    return YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("cannot read attr '" + key + "' of run " + id_ + ": " + e.what());
  }
}

std::optional<std::string> Run::GetString(const std::string& key) const {
  auto node = GetAttr(key);
  if (!node || !node->IsScalar()) {
    return std::nullopt;
  }
  return node->as<std::string>();
}

std::optional<std::int64_t> Run::GetInt(const std::string& key) const {
  auto node = GetAttr(key);
  if (!node || !node->IsScalar()) {
    return std::nullopt;
  }
  try {
    return node->as<std::int64_t>();
  } catch (const YAML::BadConversion&) {
    return std::nullopt;
  }
}

} // namespace runtrack::run
