/*
 * vibecli C++17 - Terminal coding agent
 *
 * Usage:
 *   ./vibecli [--config config.json] [--no-context] [project_dir]
 */
#include <vibecli/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = vibecli::Application::instance();
    
    if (!app.init(argc, argv)) {
        // --help/--version exit 0, startup failures carry their own code
        int code = app.exit_code();
        app.shutdown();
        return code;
    }
    
    int result = app.run();
    app.shutdown();
    
    return result;
}
