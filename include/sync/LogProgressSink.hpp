#pragma once

#include "sync/model/Progress.hpp"

namespace ts::sync {

// Forwards progress to the sync logger.
class LogProgressSink final : public model::ProgressSink {
public:
    void onProgress(const model::Progress& progress) override;
};

}
