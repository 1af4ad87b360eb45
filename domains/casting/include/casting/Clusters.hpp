#pragma once

// 캐스팅 클러스터 descriptor 전체
#include <casting/clusters/ApplicationBasic.hpp>
#include <casting/clusters/ApplicationLauncher.hpp>
#include <casting/clusters/ContentLauncher.hpp>
#include <casting/clusters/KeypadInput.hpp>
#include <casting/clusters/LevelControl.hpp>
#include <casting/clusters/MediaPlayback.hpp>
#include <casting/clusters/TargetNavigator.hpp>
