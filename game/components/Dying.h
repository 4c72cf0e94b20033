// Dead entity waiting for its removal event.
#pragma once

namespace Sundown {

struct Dying {
    double removeAtMs{0.0};
};

}  // namespace Sundown
