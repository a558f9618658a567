#pragma once

#include <trigon/app.hpp>
#include <trigon/canvas.hpp>
#include <trigon/color.hpp>
#include <trigon/export.hpp>
#include <trigon/frame.hpp>
#include <trigon/geometry.hpp>
#include <trigon/label.hpp>
#include <trigon/label_fader.hpp>
#include <trigon/logger.hpp>
#include <trigon/scene.hpp>
#include <trigon/trig_engine.hpp>
