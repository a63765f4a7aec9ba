#pragma once

#include <string>
#include <tasv/db/connection.hh>
#include <vector>

namespace tasv::db {

// Returns CREATE TABLE / CREATE INDEX statements for all tables in dependency order
std::vector<std::string> schema_statements(Dialect dialect);

// Creates all tables in an empty database
void create_schema(Connection& conn);

} // namespace tasv::db
