// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>
#include <xcp/Buffer.h>
#include <xcp/CancellationToken.h>
#include <xcp/io/CopyOptions.h>
#include <xcp/io/Sink.h>
#include <xcp/io/Source.h>
#include <cstdint>
#include <memory>
#include <system_error>

namespace xcp {

/**
 * Copies all of @p source into @p sink until end of data, an error,
 * or cancellation of @p token.
 *
 * The transfer runs as a worker on the configured executor, performing
 * strictly sequential read-then-write cycles. The token is checked
 * once before anything else happens and then between cycles, a read or
 * write in flight is never interrupted.
 *
 * If @p token is cancelled while a cycle is in flight, the outcome depends
 * on CopyOptions::waitForLastOp():
 *
 * <ul>
 *   <li>@c true: the cycle in flight is awaited, the returned count is
 *       exact and the error is the token's error, unless the worker
 *       failed on its own.</li>
 *   <li>@c false: returns immediately with the token's error and a
 *       snapshot of the bytes written so far. The worker keeps running
 *       until its current cycle finishes, so the total eventually
 *       written to @p sink may exceed the returned count. Treat it as a
 *       lower bound. @p sink, @p source and an explicit buffer must
 *       outlive the worker.</li>
 * </ul>
 *
 * Status::EndOfFile reported by @p source ends the copy successfully.
 *
 * @param token cancellation token to observe.
 * @param sink where to write to.
 * @param source where to read from.
 * @param options buffer, wait and executor tunables.
 *
 * @return number of bytes accepted by @p sink and the terminal error, if any.
 */
XCP_API CopyResult copy(const CancellationToken& token,
                        Sink* sink,
                        Source* source,
                        const CopyOptions& options = CopyOptions());

/**
 * Copies all of @p source into @p sink, with the worker co-owning both.
 *
 * Use this flavor for copies that may return before their worker
 * terminated, i.e. with CopyOptions::waitForLastOp() being @c false.
 *
 * @see copy(const CancellationToken&, Sink*, Source*, const CopyOptions&)
 */
XCP_API CopyResult copy(const CancellationToken& token,
                        std::shared_ptr<Sink> sink,
                        std::shared_ptr<Source> source,
                        const CopyOptions& options = CopyOptions());

/**
 * Copies all of @p source into @p sink, using @p buffer as work buffer.
 *
 * Equivalent to passing @p buffer via CopyOptions::buffer().
 */
XCP_API CopyResult copyWithBuffer(const CancellationToken& token,
                                  Sink* sink,
                                  Source* source,
                                  MutableBufferRef buffer,
                                  const CopyOptions& options = CopyOptions());

/**
 * Copies exactly @p limit bytes from @p source into @p sink.
 *
 * Never reads more than @p limit bytes from @p source. A @p limit of 0
 * returns right away without touching @p source.
 *
 * @return @p limit without error if all bytes were copied,
 *         Status::EndOfFile if @p source ran dry before,
 *         or the error of the underlying copy().
 *
 * @throw RuntimeError with Status::InvalidArgumentError if @p limit is
 *        negative.
 */
XCP_API CopyResult copyN(const CancellationToken& token,
                         Sink* sink,
                         Source* source,
                         int64_t limit,
                         const CopyOptions& options = CopyOptions());

/**
 * Drains @p source into @p target, waiting for the last cycle on
 * cancellation.
 *
 * @p target is cleared first. On return it holds exactly the bytes read
 * from @p source.
 *
 * @return the error of the underlying copy() verbatim. All bytes read so
 *         far are kept in @p target, also on error.
 */
XCP_API std::error_code readAll(const CancellationToken& token,
                                Source* source,
                                Buffer* target);

} // namespace xcp
