/*
 * =================================================================================
 * File:      lib/BlockEngine/BlockCollaborators.h
 * Description: Contracts for the collaborators that consume engine output.
 * All calls are fire-and-forget from the engine's point of view.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class INotificationScheduler {
public:
    virtual ~INotificationScheduler() {}

    // Replaces any pending notification for the same block.
    virtual void scheduleCompletion(EpochMillis at, int blockIndex, bool isBreak) = 0;
    virtual void cancel(int blockIndex) = 0;
};

class ISnapshotPublisher {
public:
    virtual ~ISnapshotPublisher() {}

    // Best-effort mirror for widgets and crash recovery. No acknowledgement.
    virtual void publish(const RunSnapshot& snapshot) = 0;

    // Called when no session is active any more.
    virtual void clear() = 0;
};

class IBlockRepository {
public:
    virtual ~IBlockRepository() {}

    /**
     * Loads every stored block of a logical date.
     * @return false if the backing store could not be read.
     */
    virtual bool load(const std::string& date, std::vector<Block>& out) = 0;

    /**
     * Upserts one block.
     * @return false on failure. Callers treat failures as non-fatal.
     */
    virtual bool save(const Block& block) = 0;
};

// Host foreground/background hooks, implemented by BackgroundRecovery.
class ILifecycleSignal {
public:
    virtual ~ILifecycleSignal() {}
    virtual void onSuspend() = 0;
    virtual void onResume() = 0;
};
