#pragma once

// SiloCore - per-domain, per-scope SQLite storage
//
// Usage:
//   #include <SiloCore.hpp>
//
//   silo::store store(silo::configuration("var"));
//   auto& data = store.domain("refix");
//   data.register_schemas("guild", silo::key_value_schema("settings", {{"auto_fix", "0"}}));
//
//   auto guild = data.get(silo::typed_scope{"guild", 123});
//   guild->set_value("settings", "auto_fix", true);
//   bool enabled = guild->get_value<bool>("settings", "auto_fix").value_or(false);

#include "silo/log.hpp"
#include "silo/errors.hpp"
#include "silo/types.hpp"
#include "silo/db.hpp"
#include "silo/schema.hpp"
#include "silo/scope.hpp"
#include "silo/configuration.hpp"
#include "silo/connection.hpp"
#include "silo/domain.hpp"
#include "silo/store.hpp"
