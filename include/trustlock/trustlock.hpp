#pragma once

#include <trustlock/ca/certificate_authority.hpp>
#include <trustlock/ca/signing_context.hpp>
#include <trustlock/core/config.hpp>
#include <trustlock/core/log.hpp>
#include <trustlock/core/result.hpp>
#include <trustlock/device/device.hpp>
#include <trustlock/device/mac_address.hpp>
#include <trustlock/service/device_trust_service.hpp>
#include <trustlock/store/device_registry.hpp>
#include <trustlock/store/revocation_ledger.hpp>
#include <trustlock/verify/validation_pipeline.hpp>
#include <trustlock/whitelist/whitelist_cache.hpp>
#include <trustlock/workflow/registration.hpp>
#include <trustlock/workflow/revocation.hpp>
