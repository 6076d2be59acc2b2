#include "app/TaskWeaveApp.hpp"

int main(int argc, char** argv) {
    taskweave::app::TaskWeaveApp app;
    return app.Run(argc, argv);
}
