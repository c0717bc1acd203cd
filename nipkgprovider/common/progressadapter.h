/* progressadapter.h - Maps client progress events onto host activities
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _PROGRESSADAPTER_H_
#define _PROGRESSADAPTER_H_

#include "hostrequest.h"
#include "packageclient.h"

#include <string>

namespace NipkgProvider {

/**
 * ProgressActivity - The activity currently open toward the host
 */
struct ProgressActivity {
    int activityId = 0;             // 0 = no open activity
    int parentId = 0;
    std::string label;
    std::string lastActionCode;

    bool isOpen() const { return activityId != 0; }
};

/**
 * ProgressAdapter - Per-operation progress state machine
 *
 * ROTATING (install, uninstall):
 *   The first event starts an activity. Each change of action code
 *   completes the open activity and starts a new one with the same label.
 *   Events report on whichever activity is open.
 *
 * FLAT (download):
 *   begin() starts one activity before the client call. Every event reports
 *   on it and action codes are ignored.
 *
 * finish() completes the open activity, if any. Events arriving after
 * finish() are dropped, so every started activity is completed exactly once.
 *
 * One adapter belongs to one host operation. It holds no lock: the client
 * delivers events one after another while the operation blocks.
 */
class ProgressAdapter {
public:
    enum class Mode {
        ROTATING,
        FLAT
    };

    ProgressAdapter(ActivityReporter& reporter,
                    Mode mode,
                    int parentActivityId,
                    const std::string& verb,
                    const std::string& packageName);

    // Completes an activity left open as failed
    ~ProgressAdapter();

    ProgressAdapter(const ProgressAdapter&) = delete;
    ProgressAdapter& operator=(const ProgressAdapter&) = delete;

    void begin();
    void onProgress(const ProgressEvent& event);
    void finish(bool success);

    // Callback bound to this adapter, for the client call
    ProgressCallback callback();

    Mode getMode() const { return _mode; }
    const ProgressActivity& current() const { return _activity; }
    const std::string& getLabel() const { return _activity.label; }

    int getStartedCount() const { return _started; }
    int getEventCount() const { return _events; }

private:
    void startActivity();
    void completeActivity(bool success);

    ActivityReporter& _reporter;
    Mode _mode;
    std::string _packageName;
    ProgressActivity _activity;
    int _started = 0;
    int _events = 0;
    bool _finished = false;
};

} // namespace NipkgProvider

#endif // _PROGRESSADAPTER_H_

// vim:ts=4:sw=4:et
