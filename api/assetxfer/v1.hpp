#pragma once

#include "assetxfer/v1/asset.pb.h"
#include "config/config.pb.h"

namespace assetxfer::v1 {
using RuntimeConfig = ::assetxfer::runtime::config::RuntimeConfig;
}
