// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "shrinktoggle.h"
#include "constants.h"
#include "edgeresizeengine.h"
#include "interfaces.h"
#include "logging.h"
#include "stepprimitives.h"
#include "undomemory.h"

namespace WinStepper {

namespace {

// Sizes closer than this are the same size (host rounding)
constexpr qreal SizeEpsilon = 0.5;

qreal lengthOf(const QRectF& frame, bool horizontal)
{
    return horizontal ? frame.width() : frame.height();
}

} // namespace

ShrinkToggle::ShrinkToggle(UndoMemory* memory, EdgeResizeEngine* edgeEngine, ISettings* settings,
                           IHighlighter* highlighter)
    : m_memory(memory)
    , m_edgeEngine(edgeEngine)
    , m_settings(settings)
    , m_highlighter(highlighter)
{
}

bool ShrinkToggle::shrink(IWindow* window, Direction direction)
{
    if (!window || !window->screen() || !m_memory) {
        return false;
    }

    if (direction == Direction::Left || direction == Direction::Up) {
        return shrinkToMinimum(window, direction);
    }
    return restoreOrGrow(window, direction);
}

bool ShrinkToggle::shrinkToMinimum(IWindow* window, Direction direction)
{
    const bool horizontal = isHorizontal(direction);
    const UndoFeature slot = horizontal ? UndoFeature::ShrinkWidth : UndoFeature::ShrinkHeight;
    const int maxIterations = m_settings ? m_settings->shrinkMaxIterations() : Defaults::ShrinkMaxIterations;
    const int divisions = m_settings ? m_settings->stepDivisions() : Defaults::StepDivisions;

    qreal appMinimum = 0;
    if (m_settings) {
        const QSize minimum = m_settings->minimumSizeForApp(window->appName());
        appMinimum = horizontal ? minimum.width() : minimum.height();
    }

    const QRectF initial = window->frame();
    int iterations = 0;
    for (; iterations < maxIterations; ++iterations) {
        const qreal before = lengthOf(window->frame(), horizontal);
        if (appMinimum > 0 && before <= appMinimum) {
            break;
        }

        StepPrimitives::stepResize(window, direction, divisions);
        QRectF after = window->frame();

        if (appMinimum > 0 && lengthOf(after, horizontal) < appMinimum) {
            if (horizontal) {
                after.setWidth(appMinimum);
            } else {
                after.setHeight(appMinimum);
            }
            window->setFrame(after);
            break;
        }
        if (qAbs(lengthOf(after, horizontal) - before) < SizeEpsilon) {
            // Host refused to shrink further: its own minimum
            break;
        }
    }

    if (iterations >= maxIterations) {
        qCDebug(lcCore) << "Shrink stopped at iteration cap for" << window->id();
    }

    const QRectF result = window->frame();
    if (qAbs(lengthOf(result, horizontal) - lengthOf(initial, horizontal)) < SizeEpsilon) {
        qCDebug(lcCore) << "Shrink: size unchanged for" << window->id();
        return false;
    }

    m_memory->storeOnce(slot, window->id(), initial, window->screen()->id());
    qCDebug(lcCore) << "Shrunk" << window->id() << (horizontal ? "width" : "height") << "to"
                    << lengthOf(result, horizontal) << "after" << iterations << "steps";
    if (m_highlighter) {
        m_highlighter->flash(result, horizontal ? Edge::Right : Edge::Bottom);
    }
    return true;
}

bool ShrinkToggle::restoreOrGrow(IWindow* window, Direction direction)
{
    const bool horizontal = isHorizontal(direction);
    const UndoFeature slot = horizontal ? UndoFeature::ShrinkWidth : UndoFeature::ShrinkHeight;

    const auto saved = m_memory->take(slot, window->id());
    if (!saved) {
        return m_edgeEngine ? m_edgeEngine->resizeToEdge(window, direction) : false;
    }

    QRectF frame = window->frame();
    if (horizontal) {
        frame.moveLeft(saved->frame.x());
        frame.setWidth(saved->frame.width());
    } else {
        frame.moveTop(saved->frame.y());
        frame.setHeight(saved->frame.height());
    }
    qCDebug(lcCore) << "Shrink restore" << window->id() << frame;
    window->setFrame(frame);
    if (m_highlighter) {
        m_highlighter->flash(frame, Edge::None);
    }
    return true;
}

} // namespace WinStepper
