#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "internal/model/command.hpp"
#include "internal/model/flag_value.hpp"

namespace runtrack::run {

using AttrValue = std::variant<std::string, std::int64_t, std::vector<std::string>, model::FlagMap, model::EnvMap>;

/*
  One tracked execution.

  Layout:
      <path>/                  working directory of the operation
      <path>/.runtrack/        run metadata
      <path>/.runtrack/attrs/  one YAML document per attribute
      <path>/.runtrack/LOCK    pid of the live child process

  Attribute writes replace the previous value atomically
  (write tmp → rename).
*/
class Run {
 public:
  Run(std::string id, std::filesystem::path path);

  // Opens an existing run directory; the id is the directory name.
  static Run FromPath(const std::filesystem::path& path);

  const std::string& Id() const {
    return id_;
  }

  const std::filesystem::path& Path() const {
    return path_;
  }

  /*
    Creates the on-disk scaffold. Throws std::runtime_error when the run
    was already initialized or the directories cannot be created.
  */
  void InitSkeleton();

  // Path of a metadata file inside the run, e.g. MetaPath("LOCK").
  std::filesystem::path MetaPath(const std::string& name) const;

  void WriteAttr(const std::string& key, const AttrValue& value) const;

  bool                        HasAttr(const std::string& key) const;
  std::optional<YAML::Node>   GetAttr(const std::string& key) const;
  std::optional<std::string>  GetString(const std::string& key) const;
  std::optional<std::int64_t> GetInt(const std::string& key) const;

 private:
  std::filesystem::path AttrPath(const std::string& key) const;

  std::string           id_;
  std::filesystem::path path_;
};

} // namespace runtrack::run
