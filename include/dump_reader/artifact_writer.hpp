#pragma once
#include <string>

namespace dr {

// Writes <artifact_root>/<slug>/run.json, creating directories as needed.
bool write_run_artifact(const std::string& artifact_root,
                        const std::string& slug,
                        const std::string& run_json_str,
                        std::string* err_out = nullptr);

}
