#include "doco_config.h"

#include "doco/core/error.h"

#include <cstdlib>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/vector.h>

namespace doco {

namespace {

bool parse_bool(kj::StringPtr name, kj::StringPtr value) {
  for (auto yes : {"1"_kj, "t"_kj, "T"_kj, "true"_kj, "TRUE"_kj, "True"_kj}) {
    if (value == yes) {
      return true;
    }
  }
  for (auto no : {"0"_kj, "f"_kj, "F"_kj, "false"_kj, "FALSE"_kj, "False"_kj}) {
    if (value == no) {
      return false;
    }
  }
  core::ConfigException(kj::str("invalid boolean for ", name, ": ", value)).throwException();
}

int64_t parse_int(kj::StringPtr name, kj::StringPtr value) {
  KJ_IF_SOME(parsed, value.tryParseAs<int64_t>()) {
    return parsed;
  }
  core::ConfigException(kj::str("invalid integer for ", name, ": ", value)).throwException();
}

struct Variable {
  kj::StringPtr key;
  kj::StringPtr type;
  kj::StringPtr fallback;
  kj::StringPtr description;
};

const Variable kVariables[] = {
    {"DOCO_SERVERADDR", "String", ":8081", "API listen address"},
    {"DOCO_LOADBALANCERADDR", "String", ":8080", "proxy listen address"},
    {"DOCO_ROOTPATH", "String", "./web/dist", "static web bundle served by the proxy"},
    {"DOCO_BLOBDIR", "String", "./blobs", "directory backing the blob store"},
    {"DOCO_REQUIREAUTH", "True or False", "false", "require a session for blob downloads"},
    {"DOCO_SESSIONLIFETIME", "Integer", "86400", "session lifetime in seconds"},
    {"DOCO_SHUTDOWNGRACE", "Integer", "5", "seconds to drain connections on shutdown"},
    {"DOCO_DEBUG", "True or False", "false", "debug logging with colored text"},
};

kj::String pad(kj::StringPtr text, size_t width) {
  if (text.size() >= width) {
    return kj::str(text, " ");
  }
  auto padding = kj::heapString(width - text.size());
  for (auto& c : padding) {
    c = ' ';
  }
  return kj::str(text, padding);
}

} // namespace

DocoConfig DocoConfig::load_from_env() {
  EnvLookup lookup = [](kj::StringPtr name) -> kj::Maybe<kj::StringPtr> {
    if (const char* value = std::getenv(name.cStr())) {
      return kj::StringPtr(value);
    }
    return kj::none;
  };
  return load(lookup);
}

DocoConfig DocoConfig::load(EnvLookup& lookup) {
  DocoConfig config;

  KJ_IF_SOME(value, lookup("DOCO_SERVERADDR")) {
    config.server_addr = kj::str(value);
  }
  KJ_IF_SOME(value, lookup("DOCO_LOADBALANCERADDR")) {
    config.load_balancer_addr = kj::str(value);
  }
  KJ_IF_SOME(value, lookup("DOCO_ROOTPATH")) {
    config.root_path = kj::str(value);
  }
  KJ_IF_SOME(value, lookup("DOCO_BLOBDIR")) {
    config.blob_dir = kj::str(value);
  }
  KJ_IF_SOME(value, lookup("DOCO_REQUIREAUTH")) {
    config.require_auth = parse_bool("DOCO_REQUIREAUTH", value);
  }
  KJ_IF_SOME(value, lookup("DOCO_SESSIONLIFETIME")) {
    config.session_lifetime_seconds = parse_int("DOCO_SESSIONLIFETIME", value);
  }
  KJ_IF_SOME(value, lookup("DOCO_SHUTDOWNGRACE")) {
    config.shutdown_grace_seconds = parse_int("DOCO_SHUTDOWNGRACE", value);
  }
  KJ_IF_SOME(value, lookup("DOCO_DEBUG")) {
    config.debug = parse_bool("DOCO_DEBUG", value);
  }

  return config;
}

void DocoConfig::validate() const {
  if (server_addr.size() == 0) {
    core::ConfigException("DOCO_SERVERADDR must not be empty").throwException();
  }
  if (load_balancer_addr.size() == 0) {
    core::ConfigException("DOCO_LOADBALANCERADDR must not be empty").throwException();
  }
  if (server_addr == load_balancer_addr) {
    core::ConfigException(
        kj::str("server and load balancer cannot share an address: ", server_addr))
        .throwException();
  }
  if (root_path.size() == 0) {
    core::ConfigException("DOCO_ROOTPATH must not be empty").throwException();
  }
  if (session_lifetime_seconds <= 0) {
    core::ConfigException("DOCO_SESSIONLIFETIME must be > 0").throwException();
  }
  if (shutdown_grace_seconds <= 0) {
    core::ConfigException("DOCO_SHUTDOWNGRACE must be > 0").throwException();
  }

  auto fs = kj::newDiskFilesystem();
  auto root = fs->getCurrentPath().evalNative(root_path);
  if (!fs->getRoot().exists(root)) {
    KJ_LOG(WARNING, "static root does not exist, web requests will fail", root_path);
  }
}

kj::String DocoConfig::describe() const {
  auto lifetime = kj::str(session_lifetime_seconds);
  auto grace = kj::str(shutdown_grace_seconds);
  kj::StringPtr current[] = {
      server_addr,
      load_balancer_addr,
      root_path,
      blob_dir,
      require_auth ? "true"_kj : "false"_kj,
      lifetime,
      grace,
      debug ? "true"_kj : "false"_kj,
  };

  kj::Vector<kj::String> lines;
  lines.add(kj::str(pad("KEY", 24), pad("TYPE", 16), pad("DEFAULT", 12), "VALUE"));
  for (size_t i = 0; i < kj::size(kVariables); ++i) {
    auto& variable = kVariables[i];
    lines.add(kj::str(pad(variable.key, 24), pad(variable.type, 16), pad(variable.fallback, 12),
                      current[i]));
  }
  return kj::str(kj::strArray(lines, "\n"), "\n");
}

kj::StringPtr DocoConfig::usage() {
  return "Usage: doco [--config] [--help]\n"
         "\n"
         "Runs the doco API service and its reverse proxy until SIGINT or SIGTERM.\n"
         "\n"
         "Options:\n"
         "  --config  print the configuration variables and their values, then exit\n"
         "  --help    print this message, then exit\n"
         "\n"
         "Environment:\n"
         "  DOCO_SERVERADDR        API listen address (default :8081)\n"
         "  DOCO_LOADBALANCERADDR  proxy listen address (default :8080)\n"
         "  DOCO_ROOTPATH          static web bundle (default ./web/dist)\n"
         "  DOCO_BLOBDIR           blob directory (default ./blobs)\n"
         "  DOCO_REQUIREAUTH       require a session for blob downloads (default false)\n"
         "  DOCO_SESSIONLIFETIME   session lifetime in seconds (default 86400)\n"
         "  DOCO_SHUTDOWNGRACE     shutdown drain in seconds (default 5)\n"
         "  DOCO_DEBUG             debug logging (default false)\n"_kj;
}

} // namespace doco
