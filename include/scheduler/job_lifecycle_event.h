// job_lifecycle_event.h
#pragma once
#include <functional>

struct JobRecord;

enum class JobEvent {
    Submitted,
    Started,
    Finished,   // 进入任一终态
    Removed
};

const char* to_string(JobEvent ev);

// 回调签名：事件类型 + 记录快照，在注册表锁外调用。
// Finished 回调执行完之后才唤醒 wait() 的调用者，
// 因此回调里不能对同一个作业调用 wait/cancel/deleteJob，否则会死锁
using JobLifecycleCb = std::function<void(JobEvent, const JobRecord&)>;
