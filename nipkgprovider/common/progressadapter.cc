/* progressadapter.cc - Maps client progress events onto host activities
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "progressadapter.h"
#include "structuredlog.h"

#include <algorithm>
#include <exception>

namespace NipkgProvider {

ProgressAdapter::ProgressAdapter(ActivityReporter& reporter,
                                 Mode mode,
                                 int parentActivityId,
                                 const std::string& verb,
                                 const std::string& packageName)
    : _reporter(reporter)
    , _mode(mode)
    , _packageName(packageName)
{
    _activity.parentId = parentActivityId;
    _activity.label = verb + " " + packageName;
}

ProgressAdapter::~ProgressAdapter()
{
    if (!_activity.isOpen()) {
        return;
    }
    try {
        completeActivity(false);
    } catch (const std::exception& e) {
        LOG(LogLevel::WARN)
            .package(_packageName)
            .field("label", _activity.label)
            .message(std::string("cannot complete progress activity: ") + e.what())
            .emit();
    }
}

void ProgressAdapter::begin()
{
    if (_mode == Mode::FLAT && !_activity.isOpen() && !_finished) {
        startActivity();
    }
}

void ProgressAdapter::onProgress(const ProgressEvent& event)
{
    if (_finished) {
        // The client call has already returned
        return;
    }

    _events++;
    int percent = std::clamp(event.percentageCompleted, 0, 100);

    LOG(LogLevel::DEBUG)
        .package(_packageName)
        .field("action", event.actionCode)
        .field("percent", std::to_string(percent))
        .field("activityId", std::to_string(_activity.activityId))
        .message("progress")
        .emit();

    if (_mode == Mode::FLAT) {
        if (_activity.isOpen()) {
            _reporter.progress(_activity.activityId, percent, _activity.label);
        }
        return;
    }

    // A rejected start (id 0) still counts, so a repeated action code does
    // not ask the host again
    if (_started == 0 || event.actionCode != _activity.lastActionCode) {
        if (_activity.isOpen()) {
            completeActivity(true);
        }
        startActivity();
        _activity.lastActionCode = event.actionCode;
    }

    if (_activity.isOpen()) {
        _reporter.progress(_activity.activityId, percent,
                           event.actionCode + " " + event.argument);
    }
}

void ProgressAdapter::finish(bool success)
{
    if (_activity.isOpen()) {
        completeActivity(success);
    }
    _finished = true;
}

ProgressCallback ProgressAdapter::callback()
{
    // Runs on the client's worker thread; nothing may escape into it
    return [this](const ProgressEvent& event) {
        try {
            onProgress(event);
        } catch (const std::exception& e) {
            LOG(LogLevel::WARN)
                .package(_packageName)
                .field("action", event.actionCode)
                .message(std::string("progress event dropped: ") + e.what())
                .emit();
        }
    };
}

void ProgressAdapter::startActivity()
{
    _activity.activityId = _reporter.startProgress(_activity.parentId, _activity.label);
    _started++;

    if (!_activity.isOpen()) {
        LOG(LogLevel::WARN)
            .package(_packageName)
            .field("label", _activity.label)
            .message("host did not start a progress activity")
            .emit();
    }
}

void ProgressAdapter::completeActivity(bool success)
{
    _reporter.completeProgress(_activity.activityId, success);
    _activity.activityId = 0;
}

} // namespace NipkgProvider

// vim:ts=4:sw=4:et
