#pragma once

#include <ballot/schema/encoding/scale/encoder.hpp>
#include <ballot/storage/rocksdb/storage.hpp>

namespace ballot::governance {

using encoder_t = ballot::schema::encoding::encoder<
    ballot::schema::encoding::scale_encoder_tag>;
using storage_t =
    ballot::storage::storage<ballot::storage::rocksdb_storage_tag>;

}  // namespace ballot::governance
