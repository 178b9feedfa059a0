// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <starksign/api/operations.hpp>
#include <starksign/infra/common/log.hpp>

namespace starksign::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up options for the signing domain, defaulting to the testnet preset
//! \remarks --mainnet switches to the mainnet preset and excludes the individual domain options
void add_domain_options(CLI::App& cli, api::DomainRequest& domain);

//! \brief Set up option selecting the emitted second signature component
void add_signature_form_option(CLI::App& cli, SignerSettings& settings);

}  // namespace starksign::cmd::common
