#pragma once

#include "schema_migrator.hpp"

namespace gigbook::schema {

/*
  Migrator with every upgrade step this build knows about.

    notes    v1 -> v2   `type` renamed to `captureMethod`
    setlists v1 -> v2   `feedback` list added, `totalDuration` recomputed
    contacts v1 -> v2   `interactions` / `reminders` lists added
*/
SchemaMigrator DefaultMigrator();

} // namespace gigbook::schema
