#pragma once

//
// FanoutBench
//
//   Benchmark harness for I/O-bound fan-out work: every work unit needs two independent
//   upstream fetches, and the question is which scheduling substrate runs many of them best.
//
//   - BoundedResourcePool  : fixed-size lease pool of upstream clients
//   - Executor             : submit / await-with-timeout, as a bounded worker pool or
//                            one lightweight thread per task
//   - UnitProcessor        : fan-out of one unit into two sub-fetches
//   - BatchDriver          : fan-out of a batch into one task per unit
//   - MetricsCollector     : concurrent timing, memory and error samples
//   - LoadGenerator        : ramped virtual users against a batch entry point
//

#include <fanoutbench/util/macros.h>

#include <fanoutbench/util/logging.h>
#include <fanoutbench/util/process_info.h>
#include <fanoutbench/util/random.h>
#include <fanoutbench/util/time_format.h>

#include <fanoutbench/core/errors.h>
#include <fanoutbench/core/types.h>

#include <fanoutbench/pool/resource_pool.h>

#include <fanoutbench/executor/executor.h>
#include <fanoutbench/executor/executor_factory.h>
#include <fanoutbench/executor/lightweight_executor.h>
#include <fanoutbench/executor/task_handle.h>
#include <fanoutbench/executor/worker_pool_executor.h>

#include <fanoutbench/client/api_client.h>
#include <fanoutbench/client/api_client_pool.h>

#include <fanoutbench/metrics/metrics_collector.h>
#include <fanoutbench/metrics/percentile.h>

#include <fanoutbench/processing/batch_driver.h>
#include <fanoutbench/processing/unit_generator.h>
#include <fanoutbench/processing/unit_processor.h>

#include <fanoutbench/load/load_generator.h>
#include <fanoutbench/load/load_profile.h>
#include <fanoutbench/load/stop_signal.h>

#include <fanoutbench/config/bench_config.h>

#include <fanoutbench/processing/feed_implementation.h>

#include <fanoutbench/benchmark/benchmark_runner.h>

#include <fanoutbench/report/results_writer.h>
