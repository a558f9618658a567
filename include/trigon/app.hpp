#pragma once

#include <memory>
#include <trigon/scene.hpp>

namespace trigon
{

struct Settings;

// Interactive viewer: one window showing the animated diagram, driven by
// keyboard shortcuts and clicks on the value readout.
class App
{
   public:
    explicit App(const Settings& settings);
    ~App();

    App(const App&)            = delete;
    App& operator=(const App&) = delete;

    // Blocks until the window closes. Returns the process exit status.
    int run();

    SceneModel&       scene() { return scene_; }
    const SceneModel& scene() const { return scene_; }

   private:
    std::unique_ptr<Settings> settings_;
    SceneModel                scene_;
};

}   // namespace trigon
