// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "scheduled-restart/scheduled_restart_addon.hpp"

SIGNAGE_DECLARE_ADDON(signage::addons::ScheduledRestartAddon)
