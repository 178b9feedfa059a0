// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

#include <starksign/core/typed_data/domain.hpp>

namespace starksign::cmd::common {

namespace {

    void assign_preset(api::DomainRequest& domain, const StarknetDomain& preset) {
        domain.name = preset.name;
        domain.version = preset.version;
        domain.chain_id = preset.chain_id;
        domain.revision = std::to_string(preset.revision);
    }

}  // namespace

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.timezone,!--log.notimezone", log_settings.log_timezone,
                      "Appends the timezone name to log timings");
    log_opts.add_flag("--log.trim", log_settings.log_trim, "Trims log level tags");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_domain_options(CLI::App& cli, api::DomainRequest& domain) {
    assign_preset(domain, kTestnetDomain);
    auto& domain_opts = *cli.add_option_group("Domain", "Signing domain options");
    auto name_opt = domain_opts.add_option("--domain.name", domain.name, "Domain name (short string)")
                        ->capture_default_str();
    auto version_opt = domain_opts.add_option("--domain.version", domain.version, "Domain version (short string)")
                           ->capture_default_str();
    auto chain_id_opt = domain_opts.add_option("--domain.chain_id", domain.chain_id, "Chain id (short string)")
                            ->capture_default_str();
    auto revision_opt = domain_opts.add_option("--domain.revision", domain.revision, "Domain revision (base 10)")
                            ->capture_default_str();
    domain_opts
        .add_flag_callback(
            "--mainnet", [&domain]() { assign_preset(domain, kMainnetDomain); }, "Use the mainnet domain preset")
        ->excludes(name_opt)
        ->excludes(version_opt)
        ->excludes(chain_id_opt)
        ->excludes(revision_opt);
}

void add_signature_form_option(CLI::App& cli, SignerSettings& settings) {
    std::map<std::string, SignatureForm> form_mapping{
        {"standard", SignatureForm::kStandard},
        {"inverted", SignatureForm::kInverted},
    };
    cli.add_option("--form", settings.form, "Second signature component: s (standard) or its inverse w (inverted)")
        ->transform(CLI::CheckedTransformer(form_mapping, CLI::ignore_case));
}

}  // namespace starksign::cmd::common
