#pragma once

#include <memory>
#include <tasv/config.hh>
#include <tasv/db/connection.hh>

namespace tasv {

// Opens the store selected by @p config
std::unique_ptr<db::Connection> connect(const Config& config);

} // namespace tasv
