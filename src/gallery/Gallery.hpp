#pragma once
#include <vector>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include "include/types.hpp"

// identity -> 템플릿 여러 개 + 메타데이터
// 변경은 전체 벡터를 복사해서 교체(copy-on-write), 읽기는 snapshot() 으로 락 없이
class Gallery {
	public:
		Gallery() = default;
		// expectedDim > 0 이면 그 차원만 허용. 0 이면 첫 템플릿 차원으로 고정
		explicit Gallery(int expectedDim) : dim_(expectedDim), dimFixed_(expectedDim > 0) {}

		// 템플릿 1개 추가 (재정규화). 빈/0-norm/차원 불일치는 false, 갤러리 변경 없음
		bool add(const QString& identity, const std::vector<float>& tmpl,
				 const QVariantMap& metadata = {});
		// 전부 검증 후 한꺼번에 커밋 (all-or-nothing)
		bool addAll(const QString& identity, const std::vector<std::vector<float>>& tmpls,
					const QVariantMap& metadata = {});
		// 없어도 true (idempotent). 실제로 지웠는지는 반환값으로
		bool remove(const QString& identity);
		void clear();

		// 저장소에서 읽은 레코드로 재구성. 하나라도 잘못되면 false, 기존 상태 유지
		bool loadRecords(const std::vector<GalleryRecord>& records);

		QStringList allIdentities() const;
		std::vector<std::vector<float>> templatesOf(const QString& identity) const;
		QVariantMap metadataOf(const QString& identity) const;
		bool contains(const QString& identity) const;
		int size() const;
		int dim() const;

		GallerySnapshot snapshot() const;

		// 템플릿을 정규화된 사본으로 바꿔 out 에 넣음. 실패 시 false
		static bool normalized(const std::vector<float>& in, std::vector<float>& out);

	private:
		bool acceptDim(std::size_t d) const;

		mutable QMutex mu_;
		GallerySnapshot items_ = std::make_shared<const std::vector<GalleryRecord>>();
		int dim_ = 0;
		bool dimFixed_ = false;
};
