/*
 * dash - Personal time tracker
 *
 * Usage:
 *   ./dash [options] [start|end|project|status|log|remove-last|usage]
 *
 * Data lives in ~/.dash (or $DASH_HOME, or --data-dir).
 */
#include <dash/core/application.hpp>

int main(int argc, char* argv[]) {
    dash::Application& app = dash::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
