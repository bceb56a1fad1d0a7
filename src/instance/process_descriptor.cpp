#include "klm/instance/process_descriptor.hpp"

#include "klm/common/fs.hpp"
#include "klm/common/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <sstream>

namespace klm::instance {

std::optional<long long> parse_pid(const std::string &raw) {
  if (raw.empty() || !std::all_of(raw.begin(), raw.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    return std::nullopt;
  }
  long long pid = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, pid);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return pid;
}

namespace {

std::string lookup(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  return it == fields.end() ? std::string() : it->second;
}

} // namespace

std::string serialize_descriptor(const ProcessDescriptor &descriptor) {
  std::ostringstream json;
  json << "{\n";
  if (descriptor.launch_arguments.empty()) {
    json << "  \"argv\": [],\n";
  } else {
    json << "  \"argv\": [\n";
    for (std::size_t i = 0; i < descriptor.launch_arguments.size(); ++i) {
      json << "    " << common::json_quote(descriptor.launch_arguments[i]);
      json << (i + 1 < descriptor.launch_arguments.size() ? ",\n" : "\n");
    }
    json << "  ],\n";
  }
  json << "  \"cwd\": " << common::json_quote(descriptor.working_directory) << ",\n";
  json << "  \"exe\": " << common::json_quote(descriptor.executable_path) << ",\n";
  json << "  \"kicad_api_socket\": "
       << (descriptor.ipc_socket_hint.has_value() ? common::json_quote(*descriptor.ipc_socket_hint)
                                                  : std::string("null"))
       << ",\n";
  json << "  \"pid\": " << descriptor.pid << "\n";
  json << "}\n";
  return json.str();
}

std::optional<ProcessDescriptor> parse_descriptor(const std::string &text) {
  if (!common::json_is_object(text)) {
    return std::nullopt;
  }
  const auto fields = common::json_parse_flat(text);
  const auto pid = parse_pid(common::trim(lookup(fields, "pid")));
  if (!pid.has_value()) {
    return std::nullopt;
  }

  ProcessDescriptor descriptor;
  descriptor.pid = *pid;
  descriptor.executable_path = lookup(fields, "exe");
  descriptor.working_directory = lookup(fields, "cwd");
  descriptor.launch_arguments = common::json_parse_string_array(lookup(fields, "argv"));
  if (const auto it = fields.find("kicad_api_socket"); it != fields.end() && it->second != "null") {
    descriptor.ipc_socket_hint = it->second;
  }
  return descriptor;
}

DescriptorStore::DescriptorStore(std::filesystem::path path) : path_(std::move(path)) {}

common::Status DescriptorStore::write(const ProcessDescriptor &descriptor) const {
  try {
    return common::write_text_file_atomic(path_, serialize_descriptor(descriptor));
  } catch (const std::exception &ex) {
    return common::Status::error(std::string("descriptor write failed: ") + ex.what());
  }
}

std::optional<ProcessDescriptor> DescriptorStore::read() const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    return std::nullopt;
  }
  auto content = common::read_text_file(path_);
  if (!content.ok()) {
    return std::nullopt;
  }
  return parse_descriptor(content.value());
}

common::Status DescriptorStore::remove() const {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    return common::Status::error("failed to remove descriptor: " + ec.message());
  }
  return common::Status::success();
}

} // namespace klm::instance
