#pragma once

// Identity-keyed credential registry
// Composes addressing, storage, registry and host modules

#include "keyreg/address/curve.hpp"
#include "keyreg/address/derivation.hpp"
#include "keyreg/common/base58.hpp"
#include "keyreg/common/bytes.hpp"
#include "keyreg/common/error.hpp"
#include "keyreg/config.hpp"
#include "keyreg/host/keypair.hpp"
#include "keyreg/host/log_sink.hpp"
#include "keyreg/host/request.hpp"
#include "keyreg/host/runtime.hpp"
#include "keyreg/registry/key_record.hpp"
#include "keyreg/registry/key_registry.hpp"
#include "keyreg/registry/registry_client.hpp"
#include "keyreg/storage/memory_slot_store.hpp"
#include "keyreg/storage/slot_store.hpp"
#include "keyreg/storage/sqlite_slot_store.hpp"
