#pragma once

namespace memmon::detail {
    int getPid();
}
