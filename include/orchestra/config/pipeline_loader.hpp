#pragma once

#include "orchestra/core/error.hpp"
#include "orchestra/graph/pipeline.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace orchestra {

// Reads pipeline documents in YAML or JSON. Tasks may embed their component
// inline; such components are hoisted into the component list by name.
class PipelineLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<PipelineSpec>;
  [[nodiscard]] static auto load_from_string(std::string_view text)
      -> Result<PipelineSpec>;
  [[nodiscard]] static auto load_from_json(std::string_view text)
      -> Result<PipelineSpec>;
};

// Parses "name=value" pairs given on the command line.
[[nodiscard]] auto parse_run_inputs(const std::vector<std::string>& pairs)
    -> Result<std::map<std::string, std::string>>;

}  // namespace orchestra
