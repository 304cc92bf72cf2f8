#include "log_channel.hpp"

namespace base {

const log_channel log_channel::cli("cli");
const log_channel log_channel::codec("codec");
const log_channel log_channel::config("config");
const log_channel log_channel::export_("export");
const log_channel log_channel::generic("generic");
const log_channel log_channel::geonames("geonames");
const log_channel log_channel::merge("merge");
const log_channel log_channel::schema("schema");
const log_channel log_channel::storage_local("storage_local");
const log_channel log_channel::timezone("timezone");
const log_channel log_channel::validate("validate");

} // namespace base
