#pragma once

#include <choc/containers/choc_Value.h>

#include "../audio/AudioCodec.hpp"
#include "../tasks/TaskTypes.hpp"
#include "AudioJobService.hpp"

namespace lionsfx {

    // Object shapes handed to the HTTP layer. Timestamps are milliseconds since the Unix epoch.
    choc::value::Value toJson(const TaskSnapshot& snapshot);
    choc::value::Value toJson(const ServiceStatus& status);
    choc::value::Value toJson(const AudioFileInfo& info);

}
