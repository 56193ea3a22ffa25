#include "pipeline/RecognitionWorker.hpp"
#include "log/attendance_logging.hpp"
#include <QtCore/QDebug>

namespace {
constexpr unsigned long kWaitMs = 200;
}

RecognitionWorker::RecognitionWorker(LatestFrameMailbox* mailbox, RecognitionPipeline* pipeline,
									 AttendanceSession* session)
	: QObject(nullptr), mailbox_(mailbox), pipeline_(pipeline), session_(session)
{
	connect(&thread_, &QThread::started, this, &RecognitionWorker::loop, Qt::QueuedConnection);
	moveToThread(&thread_);
}

RecognitionWorker::~RecognitionWorker()
{
	stop();
}

void RecognitionWorker::start()
{
	if (running_.exchange(true)) return;
	thread_.start();
}

void RecognitionWorker::stop()
{
	running_ = false;
	if (mailbox_) mailbox_->close();
	if (thread_.isRunning() && QThread::currentThread() != &thread_) {
		thread_.quit();
		thread_.wait();
	}
}

int RecognitionWorker::processOnce(const Frame& frame)
{
	if (!pipeline_ || !session_) return 0;

	const auto results = pipeline_->process(frame.bgr);
	const auto marked = session_->observe(results);
	for (const auto& ev : marked) emit presenceMarked(ev.identity, ev.confidence);

	if (!deadlineSignalled_ && session_->state() == SessionState::Ended) {
		deadlineSignalled_ = true;
		emit deadlineReached();
	}
	return static_cast<int>(marked.size());
}

void RecognitionWorker::loop()
{
	qCInfo(LC_PIPELINE) << "[Worker] recognition loop started";

	Frame f;
	while (running_.load()) {
		if (!mailbox_ || !mailbox_->waitConsume(f, kWaitMs)) continue;
		try {
			processOnce(f);
		} catch (const cv::Exception& e) {
			qCWarning(LC_PIPELINE) << "[Worker] frame" << f.seq << "failed:" << e.what();
		}
	}

	qCInfo(LC_PIPELINE) << "[Worker] recognition loop stopped, dropped frames="
						<< (mailbox_ ? mailbox_->dropped() : 0);
	thread_.quit();
}
