#pragma once

#include <vector>

#include "ledgersync/v1/document.pb.h"

namespace ledgersync::v1 {
using RemoteDocuments = std::vector<RemoteDocument>;
}
