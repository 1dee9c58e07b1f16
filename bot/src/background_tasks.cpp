#include "background_tasks.hpp"

BackgroundTasks& background_tasks() {
    static BackgroundTasks tasks;
    return tasks;
}
