#include "./error_handler.hpp"

#include <cubuild/build/arch_list.hpp>
#include <cubuild/build/pipeline.hpp>
#include <cubuild/error/errors.hpp>
#include <cubuild/error/marker.hpp>
#include <cubuild/error/result.hpp>
#include <cubuild/project/project_file.hpp>
#include <cubuild/toolchain/tools.hpp>
#include <cubuild/util/fs/shutil.hpp>
#include <cubuild/util/log.hpp>
#include <cubuild/util/signal.hpp>
#include <cubuild/util/string.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/handle_errors.hpp>
#include <boost/leaf/pred.hpp>
#include <sstream>
#include <system_error>

using namespace cubuild;

namespace {

std::string diag_string(boost::leaf::verbose_diagnostic_info const& diag) {
    std::ostringstream out;
    out << diag;
    return out.str();
}

/// Log the explanation of the failure class, write its marker, and return `rc`
int conclude(errc ec, int rc) noexcept {
    cubuild_log(error, "{}", trim_view(explanation_of(ec)));
    cubuild_log(error, "Refer: {}", error_reference_of(ec));
    write_error_marker(error_marker_of(ec));
    return rc;
}

auto handlers = std::tuple(  //
    [](user_cancelled) {
        cubuild_log(critical, "Operation cancelled by the user");
        return 2;
    },
    [](matchv<errc::missing_tool>, e_missing_tool tool, e_human_message msg) {
        cubuild_log(error, "Error: {}", msg.value);
        cubuild_log(error, "  ('{}' is required, but could not be found)", tool.value);
        return conclude(errc::missing_tool, 1);
    },
    [](matchv<errc::invalid_project_file>,
       e_human_message             msg,
       e_project_file_path const*  fpath,
       e_bad_project_key const*    badkey,
       e_yaml_parse_error const*   yaml_err,
       boost::leaf::e_errno const* err) {
        cubuild_log(error, "Error: {}", msg.value);
        if (fpath) {
            cubuild_log(error,
                        "  (While reading project settings from [{}])",
                        fpath->value.string());
        }
        if (yaml_err) {
            cubuild_log(error, "  YAML error: {}", yaml_err->value);
        }
        if (badkey && badkey->nearest) {
            cubuild_log(error, "  (Did you mean '{}'?)", *badkey->nearest);
        }
        if (err) {
            cubuild_log(debug, "  (errno {})", err->value);
        }
        return conclude(errc::invalid_project_file, 1);
    },
    [](matchv<errc::invalid_configuration>,
       e_human_message            msg,
       e_invalid_cuda_arch const* bad_arch,
       e_project_file_path const* fpath) {
        cubuild_log(error, "Error: {}", msg.value);
        if (bad_arch && !bad_arch->value.empty()) {
            cubuild_log(error, "  (Invalid CUDA architecture '{}')", bad_arch->value);
        }
        if (fpath) {
            cubuild_log(error,
                        "  (While reading project settings from [{}])",
                        fpath->value.string());
        }
        return conclude(errc::invalid_configuration, 2);
    },
    [](matchv<errc::filesystem_failure>,
       std::error_code           ec,
       e_human_message const*    msg,
       e_remove_file const*      removing,
       e_create_directory const* creating) {
        if (msg) {
            cubuild_log(error, "Error: {}", msg->value);
        } else if (removing) {
            cubuild_log(error,
                        "Error: Failed to remove [{}]: {}",
                        removing->value.string(),
                        ec.message());
        } else if (creating) {
            cubuild_log(error,
                        "Error: Failed to create directory [{}]: {}",
                        creating->value.string(),
                        ec.message());
        } else {
            cubuild_log(error, "Error: {}", ec.message());
        }
        return conclude(errc::filesystem_failure, 1);
    },
    [](errc                                        ec,
       e_human_message                             msg,
       e_command                                   cmd,
       e_exit_status                               status,
       boost::leaf::verbose_diagnostic_info const& diag) {
        cubuild_log(error, "Error: {}", msg.value);
        cubuild_log(error, "  Command: {}", cmd.value);
        cubuild_log(debug, "  Exit code {}, signal {}", status.retc, status.signal);
        cubuild_log(debug, "Additional diagnostic objects:\n{}", diag_string(diag));
        return conclude(ec, 1);
    },
    [](errc ec, e_human_message const* msg, boost::leaf::verbose_diagnostic_info const& diag) {
        cubuild_log(error,
                    "Error: {}",
                    msg ? std::string_view(msg->value) : default_error_string(ec));
        cubuild_log(debug, "Additional diagnostic objects:\n{}", diag_string(diag));
        return conclude(ec, 1);
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        cubuild_log(critical,
                    "An unhandled std::system_error arose. THIS IS A CUBUILD BUG! Info: {}",
                    diag_string(diag));
        cubuild_log(critical,
                    "Exception message from std::system_error: {}",
                    exc.code().message());
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        cubuild_log(critical, "An unhandled error arose. THIS IS A CUBUILD BUG! Info: {}",
                    diag_string(diag));
        return 42;
    });

}  // namespace

int cubuild::handle_cli_errors(std::function<result<int>()> fn) noexcept {
    return boost::leaf::try_handle_all(fn, handlers);
}
