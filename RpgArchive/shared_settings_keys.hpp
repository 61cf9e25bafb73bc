#pragma once

namespace RpgArchive
{

namespace SettingsKeys
{

const char archive_path[]= "archive_path";
const char project_name[]= "project_name";
const char output_dir[]= "output_dir";
const char print_records[]= "print_records";
const char verbose_log[]= "verbose_log";

} // namespace SettingsKeys

} // namespace RpgArchive
