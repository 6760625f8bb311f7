/**
 * @file main.cpp
 * @brief pagecanvas 명령줄 도구 진입점
 *
 * 저장소 디렉터리의 페이지를 읽어 트리를 출력하거나, 정규화/편집 후 다시 저장합니다.
 *
 * 명령:
 *   inspect <page>                    섹션/열/컨트롤 트리 출력
 *   normalize <page>                  읽은 뒤 그대로 저장 (정규 마크업으로 재렌더링)
 *   create <page> --title <t>         새 페이지 생성 (--layout Article|Home)
 *   add-text <page> <html>            텍스트 컨트롤 추가 (--section N)
 *   comments <page> on|off            댓글 허용 여부 변경
 *   render <file>                     마크업 파일을 파싱해 정규 마크업 출력
 *
 * CLI 옵션:
 *   --store <경로>       페이지 저장소 디렉터리 (기본: 현재 디렉터리)
 *   --config <파일>      CanvasConfig JSON 파일
 *   --verbose            진행 로그 출력
 */

#include <QCoreApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>

#include <iostream>
#include <memory>
#include <string>

#include "canvas/canvas_config.h"
#include "canvas/client_side_page.h"
#include "store/file_page_store.h"

using namespace pagecanvas;

namespace {

// ============================================================
// 출력 헬퍼
// ============================================================

int reportError(const CanvasError& error) {
    std::cerr << "[pagecanvas] 실패 (" << error.typeString() << "): " << error.message << std::endl;
    return 1;
}

std::string describeControl(const canvas::CanvasControl& control) {
    switch (control.type()) {
        case canvas::ControlType::Text:
            return "text " + control.id() + " " + control.asText()->text();

        case canvas::ControlType::WebPart: {
            const auto* part = control.asWebPart();
            return "webpart " + control.id() + " [" + part->webPartId() + "] " + part->title();
        }

        case canvas::ControlType::Column:
            return "column-marker";
    }
    return "unknown";
}

/**
 * @brief 페이지 트리를 들여쓰기로 출력
 */
void printTree(const canvas::ClientSidePage& page) {
    std::cout << "page " << page.pageRef() << " \"" << page.title() << "\" layout="
              << canvas::toString(page.layoutType())
              << " promoted=" << static_cast<int>(page.promotedState())
              << " comments=" << (page.commentsDisabled() ? "off" : "on") << std::endl;

    for (const auto& section : page.sections()) {
        std::cout << "  section " << section.order() << std::endl;
        for (const auto& column : section.columns()) {
            std::cout << "    column " << column.order()
                      << " factor=" << canvas::toInt(column.factor()) << std::endl;
            for (const auto& control : column.controls()) {
                std::cout << "      " << control.order() << ". " << describeControl(control)
                          << std::endl;
            }
        }
    }

    for (const auto& error : page.errors()) {
        std::cout << "  ! " << error.typeString() << ": " << error.message << std::endl;
    }
}

// ============================================================
// 명령 실행
// ============================================================

int runRender(const QString& path, const canvas::CanvasConfig& config) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        std::cerr << "[pagecanvas] 파일을 열 수 없음: " << path.toStdString() << std::endl;
        return 1;
    }

    canvas::ClientSidePage page(config);
    CanvasError error;
    if (!page.fromHtml(file.readAll().toStdString(), &error)) {
        return reportError(error);
    }

    std::cout << page.toHtml() << std::endl;
    return page.errors().empty() ? 0 : 1;
}

int runPageCommand(const QString& command,
                   const QStringList& args,
                   const QCommandLineParser& parser,
                   const QCommandLineOption& titleOption,
                   const QCommandLineOption& layoutOption,
                   const QCommandLineOption& sectionOption,
                   std::shared_ptr<store::PageStore> page_store,
                   const canvas::CanvasConfig& config) {
    const std::string page_ref = args.value(1).toStdString();
    CanvasError error;

    if (command == "create") {
        auto layout = canvas::pageLayoutFromString(parser.value(layoutOption).toStdString());
        if (!layout) {
            std::cerr << "[pagecanvas] 알 수 없는 레이아웃: "
                      << parser.value(layoutOption).toStdString() << std::endl;
            return 1;
        }

        auto page = canvas::ClientSidePage::create(page_store, page_ref,
                                                   parser.value(titleOption).toStdString(),
                                                   *layout, config, &error);
        if (!page) return reportError(error);

        std::cout << "[pagecanvas] 생성됨: " << page_ref << std::endl;
        return 0;
    }

    auto page = canvas::ClientSidePage::fromStore(page_store, page_ref, config, &error);
    if (!page) return reportError(error);

    if (command == "inspect") {
        printTree(*page);
        return page->errors().empty() ? 0 : 1;
    }

    if (command == "normalize") {
        if (!page->save(&error)) return reportError(error);
        std::cout << "[pagecanvas] 정규화 완료: " << page_ref << std::endl;
        return 0;
    }

    if (command == "add-text") {
        if (args.size() < 3) {
            std::cerr << "[pagecanvas] add-text <page> <html>" << std::endl;
            return 1;
        }

        bool ok = false;
        const int section_number = parser.value(sectionOption).toInt(&ok);
        if (!ok || section_number < 1) {
            std::cerr << "[pagecanvas] 잘못된 섹션 번호: "
                      << parser.value(sectionOption).toStdString() << std::endl;
            return 1;
        }

        while (static_cast<int>(page->sections().size()) < section_number) {
            page->addSection();
        }

        auto& control = page->sections()[section_number - 1].addControl(
            canvas::CanvasControl::text(args.at(2).toStdString()));
        if (!page->save(&error)) return reportError(error);

        std::cout << "[pagecanvas] 텍스트 컨트롤 추가: " << control.id() << std::endl;
        return 0;
    }

    if (command == "comments") {
        const QString mode = args.value(2);
        bool ok = false;
        if (mode == "on") {
            ok = page->enableComments(&error);
        } else if (mode == "off") {
            ok = page->disableComments(&error);
        } else {
            std::cerr << "[pagecanvas] comments <page> on|off" << std::endl;
            return 1;
        }
        if (!ok) return reportError(error);

        std::cout << "[pagecanvas] 댓글 " << mode.toStdString() << ": " << page_ref << std::endl;
        return 0;
    }

    std::cerr << "[pagecanvas] 알 수 없는 명령: " << command.toStdString() << std::endl;
    return 1;
}

} // anonymous namespace


// ============================================================
// 메인 함수
// ============================================================

int main(int argc, char* argv[]) {
    // ---- Qt 애플리케이션 초기화 ----
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("pagecanvas");
    QCoreApplication::setApplicationVersion("1.0.0");

    // ---- CLI 인수 파싱 ----
    QCommandLineParser parser;
    parser.setApplicationDescription("PageCanvas 페이지 캔버스 도구");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption storeOption("store", "페이지 저장소 디렉터리", "dir", QDir::currentPath());
    parser.addOption(storeOption);

    QCommandLineOption configOption("config", "CanvasConfig JSON 파일", "file");
    parser.addOption(configOption);

    QCommandLineOption verboseOption("verbose", "진행 로그 출력");
    parser.addOption(verboseOption);

    QCommandLineOption titleOption("title", "새 페이지 제목 (create)", "title");
    parser.addOption(titleOption);

    QCommandLineOption layoutOption("layout", "페이지 레이아웃 Article|Home (create)", "layout",
                                    "Article");
    parser.addOption(layoutOption);

    QCommandLineOption sectionOption("section", "텍스트를 추가할 섹션 번호 (add-text)", "n", "1");
    parser.addOption(sectionOption);

    parser.addPositionalArgument("command",
                                 "inspect | normalize | create | add-text | comments | render");
    parser.addPositionalArgument("args", "명령 인수", "[args...]");

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() < 2) {
        parser.showHelp(1);
    }

    // ---- 설정 ----
    canvas::CanvasConfig config;
    if (parser.isSet(configOption)) {
        auto loaded = canvas::CanvasConfig::loadFromFile(parser.value(configOption).toStdString());
        if (!loaded) {
            return 1;
        }
        config = *loaded;
    }
    if (parser.isSet(verboseOption)) {
        config.verbose = true;
    }

    const QString command = args.at(0);
    if (command == "render") {
        return runRender(args.at(1), config);
    }

    auto page_store = std::make_shared<store::FilePageStore>(parser.value(storeOption), config.verbose);
    if (config.verbose) {
        std::cout << "[pagecanvas] 저장소: " << page_store->rootPath().toStdString() << std::endl;
    }

    return runPageCommand(command, args, parser, titleOption, layoutOption, sectionOption,
                          page_store, config);
}
