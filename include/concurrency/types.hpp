#pragma once

// true: the task performed its work; false: it was admitted but skipped.
// Failures travel as the future's exception.
typedef bool ExpectedFuture;
