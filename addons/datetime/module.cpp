// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "datetime/datetime_addon.hpp"

SIGNAGE_DECLARE_ADDON(signage::addons::DateTimeAddon)
