#include <gflags/gflags.h>

DEFINE_int32(replica_request_threads, 4, "Worker threads that run request handlers in a replica");
DEFINE_int32(metrics_gauge_period_ms, 1000, "Period for refreshing the pending/processing request gauges");
DEFINE_int32(autoscaling_record_period_ms, 500, "Period for sampling ongoing requests into the local autoscaling store");
