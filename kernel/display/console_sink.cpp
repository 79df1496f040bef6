#include "display/console_sink.hpp"

namespace strata::display {

static ConsoleSink gConsoleSink = nullptr;

void set_console_sink(ConsoleSink sink) {
    gConsoleSink = sink;
}

ConsoleSink get_console_sink() {
    return gConsoleSink;
}

} // namespace strata::display
